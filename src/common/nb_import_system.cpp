// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_import_system.cpp
 * @brief ImportSystem implementation.
 */

#include "pch.h"
#include "nb_import_system.hpp"
#include "nb_errors.hpp"
#include "nb_import_hook.hpp"
#include "nb_script_finder.hpp"
#include "nb_shell.hpp"

namespace nbimport {

ImportSystem::ImportSystem()
    : reader_(std::make_unique<NotebookReader>())
    , shell_(std::make_unique<Shell>(*this)) {}

ImportSystem::ImportSystem(const ImportConfig& config)
    : ImportSystem() {
    Configure(config);
}

ImportSystem::~ImportSystem() = default;

ImportSystem& ImportSystem::instance() {
    static ImportSystem system;
    return system;
}

void ImportSystem::Configure(const ImportConfig& config) {
    search_path_ = config.search_path;
    if (config.log_level) {
        Log::set_level(*config.log_level);
    }

    if (config.install_notebook_hook) {
        NotebookImportHook::Install(*this);
    }

    if (config.install_script_finder) {
        const bool present = std::any_of(finders_.begin(), finders_.end(), [](const auto& f) {
            return std::dynamic_pointer_cast<ScriptFileFinder>(f) != nullptr;
        });
        if (!present) {
            AppendFinder(std::make_shared<ScriptFileFinder>(*this));
        }
    }
}

bool ImportSystem::IsValidModuleName(const std::string& fullname) {
    if (fullname.empty()) return false;

    bool segment_empty = true;
    for (unsigned char c : fullname) {
        if (c == '.') {
            if (segment_empty) return false;
            segment_empty = true;
            continue;
        }
        // Non-ASCII bytes are accepted so UTF-8 names pass through.
        if (!(std::isalnum(c) || c == '_' || c >= 0x80)) return false;
        segment_empty = false;
    }
    return !segment_empty;
}

ModulePtr ImportSystem::Import(const std::string& fullname) {
    return ImportWithPath(fullname, search_path_);
}

ModulePtr ImportSystem::ImportWithPath(const std::string& fullname, const SearchPath& path) {
    if (!IsValidModuleName(fullname)) {
        throw ModuleNotFoundError(fullname);
    }

    if (auto module = modules_.Lookup(fullname)) {
        return module;
    }

    // A loader may install or remove finders; iterate a snapshot.
    const auto chain = finders_;
    for (const auto& finder : chain) {
        auto loader = finder->FindModule(fullname, path);
        if (!loader) continue;

        NB_LOG_DEBUG(finder->Name() << " finder claimed '" << fullname << "'");
        ModulePtr module = loader->LoadModule(fullname);
        if (!module) {
            throw ImportError(fullname, "loader for '" + fullname + "' returned no module");
        }
        return module;
    }

    NB_LOG_DEBUG("no finder claimed '" << fullname << "'");
    throw ModuleNotFoundError(fullname);
}

void ImportSystem::AppendFinder(std::shared_ptr<IModuleFinder> finder) {
    if (!finder) {
        throw std::invalid_argument("ImportSystem::AppendFinder: finder must not be null");
    }
    finders_.push_back(std::move(finder));
}

bool ImportSystem::RemoveFinder(const std::shared_ptr<IModuleFinder>& finder) {
    auto it = std::find(finders_.begin(), finders_.end(), finder);
    if (it == finders_.end()) {
        return false;
    }
    finders_.erase(it);
    return true;
}

void ImportSystem::AddSearchDirectory(const std::string& dir) {
    if (std::find(search_path_.begin(), search_path_.end(), dir) == search_path_.end()) {
        search_path_.push_back(dir);
    }
}

void ImportSystem::set_document_reader(std::unique_ptr<IDocumentReader> reader) {
    if (!reader) {
        throw std::invalid_argument("ImportSystem::set_document_reader: reader must not be null");
    }
    reader_ = std::move(reader);
}

} // namespace nbimport
