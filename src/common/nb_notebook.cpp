// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_notebook.cpp
 * @brief nbformat JSON reader built on nlohmann::json.
 */

#include "pch.h"
#include "nb_notebook.hpp"
#include "nb_errors.hpp"
#include <nlohmann/json.hpp>

namespace nbimport {

using json = nlohmann::json;

namespace {

// nbformat stores multiline text either as one string or as a list of lines.
std::string JoinSource(const json& source, size_t index) {
    if (source.is_string()) {
        return source.get<std::string>();
    }
    if (source.is_array()) {
        std::string out;
        for (const auto& line : source) {
            if (!line.is_string()) {
                throw FormatError("cell " + std::to_string(index) + ": source lines must be strings");
            }
            out += line.get<std::string>();
        }
        return out;
    }
    if (source.is_null()) {
        return {};
    }
    throw FormatError("cell " + std::to_string(index) + ": source must be a string or a list of strings");
}

CellKind ParseCellKind(const std::string& type) {
    if (type == "code") return CellKind::Code;
    if (type == "markdown") return CellKind::Markdown;
    return CellKind::Raw;
}

std::string ReadLanguage(const json& doc) {
    const json& metadata = doc.value("metadata", json::object());
    if (!metadata.is_object()) return {};

    if (auto ks = metadata.find("kernelspec"); ks != metadata.end() && ks->is_object()) {
        if (auto lang = ks->find("language"); lang != ks->end() && lang->is_string()) {
            return lang->get<std::string>();
        }
    }
    if (auto li = metadata.find("language_info"); li != metadata.end() && li->is_object()) {
        if (auto name = li->find("name"); name != li->end() && name->is_string()) {
            return name->get<std::string>();
        }
    }
    return {};
}

Notebook FromJson(const json& doc) {
    if (!doc.is_object()) {
        throw FormatError("notebook root must be a JSON object");
    }

    auto cells = doc.find("cells");
    if (cells == doc.end() || !cells->is_array()) {
        throw FormatError("notebook has no 'cells' array");
    }

    Notebook nb;
    if (auto v = doc.find("nbformat"); v != doc.end() && v->is_number_integer()) {
        nb.nbformat = v->get<int>();
    }
    if (auto v = doc.find("nbformat_minor"); v != doc.end() && v->is_number_integer()) {
        nb.nbformat_minor = v->get<int>();
    }
    nb.language = ReadLanguage(doc);

    nb.cells.reserve(cells->size());
    size_t index = 0;
    for (const auto& cell : *cells) {
        ++index;
        if (!cell.is_object()) {
            throw FormatError("cell " + std::to_string(index) + " is not an object");
        }
        auto type = cell.find("cell_type");
        if (type == cell.end() || !type->is_string()) {
            throw FormatError("cell " + std::to_string(index) + " has no 'cell_type'");
        }

        NotebookCell out;
        out.kind = ParseCellKind(type->get<std::string>());
        if (auto source = cell.find("source"); source != cell.end()) {
            out.source = JoinSource(*source, index);
        }
        nb.cells.push_back(std::move(out));
    }
    return nb;
}

} // anonymous namespace

const char* cell_kind_name(CellKind kind) {
    switch (kind) {
        case CellKind::Code:     return "code";
        case CellKind::Markdown: return "markdown";
        case CellKind::Raw:      return "raw";
    }
    return "unknown";
}

Notebook ParseNotebook(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw FormatError(std::string("invalid notebook JSON: ") + e.what());
    }
    return FromJson(doc);
}

Notebook ReadNotebook(std::istream& in) {
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw FormatError("failed to read notebook stream");
    }
    return ParseNotebook(text);
}

Notebook ReadNotebookFile(const std::filesystem::path& file) {
    std::ifstream f(file, std::ios::binary);
    if (!f.is_open()) {
        throw FormatError("cannot open: " + file.string());
    }
    return ReadNotebook(f);
}

std::vector<NotebookCell> NotebookReader::Read(const std::filesystem::path& file) {
    return ReadNotebookFile(file).cells;
}

} // namespace nbimport
