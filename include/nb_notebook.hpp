// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_notebook.hpp
 * @brief Notebook document model and reader.
 *
 * Parses nbformat JSON documents into an ordered list of cells. The
 * nbformat version is recorded but never validated.
 */

#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace nbimport {

enum class CellKind {
    Code,
    Markdown,
    Raw
};

const char* cell_kind_name(CellKind kind);

struct NotebookCell {
    CellKind kind{CellKind::Code};
    std::string source;
};

struct Notebook {
    std::vector<NotebookCell> cells;
    int nbformat{0};
    int nbformat_minor{0};
    std::string language;  // metadata.kernelspec.language or metadata.language_info.name
};

// All three throw FormatError on malformed documents.
Notebook ParseNotebook(const std::string& text);
Notebook ReadNotebook(std::istream& in);
Notebook ReadNotebookFile(const std::filesystem::path& file);

// Reads the ordered cell list of a document.
class IDocumentReader {
public:
    virtual ~IDocumentReader() = default;
    virtual std::vector<NotebookCell> Read(const std::filesystem::path& file) = 0;
};

class NotebookReader : public IDocumentReader {
public:
    std::vector<NotebookCell> Read(const std::filesystem::path& file) override;
};

} // namespace nbimport
