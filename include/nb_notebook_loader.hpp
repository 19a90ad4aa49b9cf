// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_notebook_loader.hpp
 * @brief Loads a notebook as a module.
 *
 * LoadModule() re-resolves the notebook against the loader's search path,
 * registers a fresh module, then executes its code cells in order with the
 * module's namespace ambient in the shell.
 */

#pragma once

#include "nb_module.hpp"
#include <memory>
#include <string>

namespace nbimport {

class ImportSystem;

class NotebookLoader : public IModuleLoader,
                       public std::enable_shared_from_this<NotebookLoader> {
public:
    NotebookLoader(ImportSystem& imports, SearchPath path);

    // Throws ResolutionError, ReadError or ExecutionError. Import errors
    // raised by cells (nested imports) propagate unchanged. A module whose
    // cell failed stays registered.
    ModulePtr LoadModule(const std::string& fullname) override;

    const SearchPath& path() const { return path_; }

private:
    ImportSystem& imports_;
    SearchPath path_;
};

} // namespace nbimport
