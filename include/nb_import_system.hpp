// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_import_system.hpp
 * @brief Module registry, resolver chain and search path of one process context.
 *
 * ImportSystem::instance() is the context the command-line driver uses;
 * embedders and tests construct their own.
 */

#pragma once

#include "nb_log.hpp"
#include "nb_module.hpp"
#include "nb_notebook.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nbimport {

class Shell;

struct ImportConfig {
    SearchPath search_path;               // Empty: current directory
    std::optional<LogLevel> log_level;    // Unset: leave Log as is
    bool install_notebook_hook = true;
    bool install_script_finder = true;
};

class ImportSystem {
public:
    // Empty resolver chain, current-directory search path.
    ImportSystem();
    explicit ImportSystem(const ImportConfig& config);
    ~ImportSystem();

    // Prevent copying
    ImportSystem(const ImportSystem&) = delete;
    ImportSystem& operator=(const ImportSystem&) = delete;

    static ImportSystem& instance();

    // Applies search path and log level, and installs the requested finders
    // unless they are already present.
    void Configure(const ImportConfig& config);

    // Registered module, or the one the first claiming finder loads.
    // Throws ModuleNotFoundError when no finder claims the name.
    ModulePtr Import(const std::string& fullname);
    ModulePtr ImportWithPath(const std::string& fullname, const SearchPath& path);

    // ---- Resolver chain ----
    void AppendFinder(std::shared_ptr<IModuleFinder> finder);
    bool RemoveFinder(const std::shared_ptr<IModuleFinder>& finder);
    const std::vector<std::shared_ptr<IModuleFinder>>& finders() const { return finders_; }

    // ---- Search path ----
    const SearchPath& search_path() const { return search_path_; }
    void set_search_path(SearchPath path) { search_path_ = std::move(path); }
    void AddSearchDirectory(const std::string& dir);

    ModuleRegistry& modules() { return modules_; }
    const ModuleRegistry& modules() const { return modules_; }

    Shell& shell() { return *shell_; }

    IDocumentReader& document_reader() { return *reader_; }
    void set_document_reader(std::unique_ptr<IDocumentReader> reader);

    static bool IsValidModuleName(const std::string& fullname);

private:
    ModuleRegistry modules_;
    std::vector<std::shared_ptr<IModuleFinder>> finders_;
    SearchPath search_path_;
    std::unique_ptr<IDocumentReader> reader_;
    std::unique_ptr<Shell> shell_;
};

} // namespace nbimport
