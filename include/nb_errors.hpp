// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_errors.hpp
 * @brief Exception hierarchy for scripts, notebooks and imports.
 *
 * Script failures derive from ScriptError, malformed notebooks raise
 * FormatError, and everything the import pipeline surfaces to an
 * importer derives from ImportError.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace nbimport {

// ============================================================
//  Script errors
// ============================================================

class ScriptError : public std::runtime_error {
public:
    explicit ScriptError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// Malformed source. what() reads "<origin>:<line>:<column>: <message>", where
// origin names the cell or file the code came from.
class ParseError : public ScriptError {
public:
    std::string origin;
    std::string message;
    uint32_t line;
    uint32_t column;
    ParseError(std::string where, std::string msg, uint32_t ln, uint32_t col)
        : ScriptError(where + ":" + std::to_string(ln) + ":" + std::to_string(col) + ": " + msg)
        , origin(std::move(where)), message(std::move(msg)), line(ln), column(col) {}
};

class RuntimeError : public ScriptError {
public:
    RuntimeError(const std::string& msg, uint32_t line = 0)
        : ScriptError(line > 0 ? msg + " (line " + std::to_string(line) + ")" : msg)
        , line_(line) {}

    uint32_t line() const { return line_; }

private:
    uint32_t line_;
};

// Raised by a script `throw` statement.
class ThrownError : public RuntimeError {
public:
    ThrownError(std::string payload, uint32_t line)
        : RuntimeError("uncaught throw: " + payload, line)
        , payload_(std::move(payload)) {}

    const std::string& payload() const { return payload_; }

private:
    std::string payload_;
};

// ============================================================
//  Document errors
// ============================================================

class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// ============================================================
//  Import errors
// ============================================================

class ImportError : public std::runtime_error {
public:
    ImportError(std::string module_name, const std::string& msg)
        : std::runtime_error(msg)
        , module_name_(std::move(module_name)) {}

    const std::string& module_name() const { return module_name_; }

private:
    std::string module_name_;
};

// No finder in the resolver chain claimed the name.
class ModuleNotFoundError : public ImportError {
public:
    explicit ModuleNotFoundError(const std::string& module_name)
        : ImportError(module_name, "No module named '" + module_name + "'") {}
};

// The document was found by a finder but is gone by the time it is loaded.
class ResolutionError : public ImportError {
public:
    explicit ResolutionError(const std::string& module_name)
        : ImportError(module_name, "cannot locate source for module '" + module_name + "'") {}
};

class ReadError : public ImportError {
public:
    ReadError(const std::string& module_name, std::filesystem::path path, const std::string& reason)
        : ImportError(module_name, "cannot read '" + path.string() + "': " + reason)
        , path_(std::move(path)) {}

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// A code cell failed. cell_index is the 1-based position of the cell in the
// document, 0 when the whole file is a single unit of code.
class ExecutionError : public ImportError {
public:
    ExecutionError(const std::string& module_name, std::filesystem::path path,
                   size_t cell_index, const std::string& reason)
        : ImportError(module_name, Describe(module_name, path, cell_index, reason))
        , path_(std::move(path))
        , cell_index_(cell_index)
        , reason_(reason) {}

    const std::filesystem::path& path() const { return path_; }
    size_t cell_index() const { return cell_index_; }
    const std::string& reason() const { return reason_; }

private:
    std::filesystem::path path_;
    size_t cell_index_;
    std::string reason_;

    static std::string Describe(const std::string& module_name, const std::filesystem::path& path,
                                size_t cell_index, const std::string& reason) {
        std::string where = path.string();
        if (cell_index > 0) {
            where += " [cell " + std::to_string(cell_index) + "]";
        }
        return "error executing module '" + module_name + "' (" + where + "): " + reason;
    }
};

} // namespace nbimport
