// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_notebook_loader.cpp
 * @brief NotebookLoader implementation.
 */

#include "pch.h"
#include "nb_notebook_loader.hpp"
#include "nb_errors.hpp"
#include "nb_import_system.hpp"
#include "nb_log.hpp"
#include "nb_notebook.hpp"
#include "nb_path_resolver.hpp"
#include "nb_shell.hpp"

namespace nbimport {

NotebookLoader::NotebookLoader(ImportSystem& imports, SearchPath path)
    : imports_(imports)
    , path_(std::move(path)) {}

ModulePtr NotebookLoader::LoadModule(const std::string& fullname) {
    // 1) locate again; the file may have moved since the finder saw it
    auto file = FindNotebook(fullname, path_);
    if (!file) {
        throw ResolutionError(fullname);
    }

    NB_LOG_INFO("importing notebook from " << file->string());

    // 2) read cells
    std::vector<NotebookCell> cells;
    try {
        cells = imports_.document_reader().Read(*file);
    } catch (const FormatError& e) {
        throw ReadError(fullname, *file, e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        throw ReadError(fullname, *file, e.what());
    }

    // 3) create and register the module before any cell runs
    auto module = std::make_shared<ModuleObject>(fullname, *file, shared_from_this());
    const NamespacePtr ns = module->bindings();
    ns->set("__name__", Value::from_string(fullname));
    ns->set("__file__", Value::from_string(file->string()));
    imports_.modules().Register(fullname, module);

    // 4) run code cells with the module namespace ambient
    Shell& shell = imports_.shell();
    AmbientNamespaceScope ambient(shell, ns);

    size_t index = 0;
    for (const auto& cell : cells) {
        ++index;
        if (cell.kind != CellKind::Code) continue;

        const std::string code = shell.TransformCell(cell.source);
        const std::string origin = file->string() + " [cell " + std::to_string(index) + "]";
        NB_DEBUG_IMPORT("%s", origin.c_str());
        try {
            shell.evaluator().Execute(code, origin, ns);
        } catch (const ScriptError& e) {
            throw ExecutionError(fullname, *file, index, e.what());
        }
    }

    return module;
}

} // namespace nbimport
