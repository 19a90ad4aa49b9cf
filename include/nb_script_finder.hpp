// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_script_finder.hpp
 * @brief Resolver-chain entry for plain script files.
 *
 * Searches each directory for `<module path>.nbs`, then
 * `<module path>/index.nbs`, where the module path is the dotted name with
 * dots turned into directory separators.
 */

#pragma once

#include "nb_loader_cache.hpp"
#include "nb_module.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace nbimport {

class ImportSystem;

inline constexpr const char* kScriptExtension = ".nbs";

std::optional<std::filesystem::path> FindScript(const std::string& fullname, const SearchPath& path);

class ScriptLoader : public IModuleLoader,
                     public std::enable_shared_from_this<ScriptLoader> {
public:
    ScriptLoader(ImportSystem& imports, SearchPath path);

    ModulePtr LoadModule(const std::string& fullname) override;

    const SearchPath& path() const { return path_; }

private:
    ImportSystem& imports_;
    SearchPath path_;

    static bool ReadAllText(const std::filesystem::path& p, std::string& out, std::string& err);
};

class ScriptFileFinder : public IModuleFinder {
public:
    explicit ScriptFileFinder(ImportSystem& imports) : imports_(imports) {}

    std::shared_ptr<IModuleLoader> FindModule(const std::string& fullname,
                                              const SearchPath& path) override;
    std::string Name() const override { return "script"; }

    const LoaderCache<ScriptLoader>& loaders() const { return loaders_; }

private:
    ImportSystem& imports_;
    LoaderCache<ScriptLoader> loaders_;
};

} // namespace nbimport
