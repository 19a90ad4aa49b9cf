// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_notebook_finder.hpp
 * @brief Resolver-chain entry for notebooks.
 */

#pragma once

#include "nb_loader_cache.hpp"
#include "nb_module.hpp"
#include "nb_notebook_loader.hpp"

namespace nbimport {

class ImportSystem;

// Claims a name when a matching notebook exists on the search path. Loaders
// are shared between requests whose search paths are equal.
class NotebookFinder : public IModuleFinder {
public:
    explicit NotebookFinder(ImportSystem& imports) : imports_(imports) {}

    std::shared_ptr<IModuleLoader> FindModule(const std::string& fullname,
                                              const SearchPath& path) override;
    std::string Name() const override { return "notebook"; }

    const LoaderCache<NotebookLoader>& loaders() const { return loaders_; }

private:
    ImportSystem& imports_;
    LoaderCache<NotebookLoader> loaders_;
};

} // namespace nbimport
