// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_runner.hpp
 * @brief Top-level execution of notebooks, scripts and projects.
 *
 * Unlike an import, running a file executes it in the shell's ambient
 * namespace (the user namespace unless a scope is active) and registers
 * no module. Failures are reported as ReadError / ExecutionError under
 * the module name `__main__`.
 */

#pragma once

#include "nb_project.hpp"
#include <filesystem>

namespace nbimport {

class ImportSystem;

void RunNotebookFile(ImportSystem& imports, const std::filesystem::path& notebook);
void RunScriptFile(ImportSystem& imports, const std::filesystem::path& script);

// Dispatches on the extension: `.ipynb` runs as a notebook, anything else
// as a script.
void RunFile(ImportSystem& imports, const std::filesystem::path& file);

// Adds the project's import roots to the search path, applies its log
// level and runs the entry file.
void RunProject(ImportSystem& imports, const NBProject& project);

} // namespace nbimport
