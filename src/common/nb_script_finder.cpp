// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_script_finder.cpp
 * @brief Script file finder and loader.
 */

#include "pch.h"
#include "nb_script_finder.hpp"
#include "nb_errors.hpp"
#include "nb_import_system.hpp"
#include "nb_log.hpp"
#include "nb_path_resolver.hpp"
#include "nb_shell.hpp"

namespace nbimport {

namespace {

bool IsRegularFile(const std::filesystem::path& p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec);
}

// "pkg.util" -> "pkg/util"
std::filesystem::path ModuleRelativePath(const std::string& fullname) {
    std::filesystem::path rel;
    size_t start = 0;
    while (true) {
        auto dot = fullname.find('.', start);
        rel /= fullname.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return rel;
}

} // anonymous namespace

std::optional<std::filesystem::path> FindScript(const std::string& fullname, const SearchPath& path) {
    if (fullname.empty()) {
        return std::nullopt;
    }
    const std::filesystem::path rel = ModuleRelativePath(fullname);

    static const SearchPath kCurrentDirectory{""};
    const SearchPath& dirs = path.empty() ? kCurrentDirectory : path;

    for (const auto& dir : dirs) {
        // (a) dir/<module>.nbs
        auto cand = std::filesystem::path(dir) / rel;
        cand += kScriptExtension;
        if (IsRegularFile(cand)) {
            return cand;
        }
        // (b) dir/<module>/index.nbs
        cand = std::filesystem::path(dir) / rel / (std::string("index") + kScriptExtension);
        if (IsRegularFile(cand)) {
            return cand;
        }
    }
    return std::nullopt;
}

// ============================================================
//  ScriptLoader
// ============================================================

ScriptLoader::ScriptLoader(ImportSystem& imports, SearchPath path)
    : imports_(imports)
    , path_(std::move(path)) {}

bool ScriptLoader::ReadAllText(const std::filesystem::path& p, std::string& out, std::string& err) {
    std::ifstream f(p, std::ios::binary);
    if (!f.is_open()) {
        err = "cannot open file: " + p.string();
        return false;
    }
    out.assign((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return true;
}

ModulePtr ScriptLoader::LoadModule(const std::string& fullname) {
    auto file = FindScript(fullname, path_);
    if (!file) {
        throw ResolutionError(fullname);
    }

    NB_LOG_INFO("importing script from " << file->string());

    std::string source;
    std::string err;
    if (!ReadAllText(*file, source, err)) {
        throw ReadError(fullname, *file, err);
    }

    auto module = std::make_shared<ModuleObject>(fullname, *file, shared_from_this());
    const NamespacePtr ns = module->bindings();
    ns->set("__name__", Value::from_string(fullname));
    ns->set("__file__", Value::from_string(file->string()));
    imports_.modules().Register(fullname, module);

    Shell& shell = imports_.shell();
    AmbientNamespaceScope ambient(shell, ns);
    try {
        shell.evaluator().Execute(source, file->string(), ns);
    } catch (const ScriptError& e) {
        throw ExecutionError(fullname, *file, 0, e.what());
    }
    return module;
}

// ============================================================
//  ScriptFileFinder
// ============================================================

std::shared_ptr<IModuleLoader> ScriptFileFinder::FindModule(const std::string& fullname,
                                                            const SearchPath& path) {
    if (!FindScript(fullname, path)) {
        return nullptr;
    }
    return loaders_.GetOrCreate(SearchPathKey(path), [&] {
        return std::make_shared<ScriptLoader>(imports_, path);
    });
}

} // namespace nbimport
