// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_path_resolver.hpp
 * @brief Maps dotted module names to notebook files on disk.
 *
 * Only the last segment of a dotted name is used: `pkg.my_nb` resolves to
 * `<dir>/my_nb.ipynb`, falling back to `<dir>/my nb.ipynb`.
 */

#pragma once

#include "nb_module.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace nbimport {

inline constexpr const char* kNotebookExtension = ".ipynb";

// "a.b.c" -> "c"
std::string LastSegment(const std::string& fullname);

// First existing `<dir>/<segment>.ipynb` (or its underscore-to-space
// variant) in search order. std::nullopt when no directory has one.
std::optional<std::filesystem::path> FindNotebook(const std::string& fullname, const SearchPath& path);

// Scalar cache key for a search path. Entries are length-prefixed, so keys
// are equal exactly when the entry lists are. The empty path and {""} both
// mean the current directory and share a key.
std::string SearchPathKey(const SearchPath& path);

} // namespace nbimport
