// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_import_hook.hpp
 * @brief Installs the notebook finder into an ImportSystem's resolver chain.
 *
 * Installation is idempotent: at most one NotebookFinder is present in a
 * chain, and a repeated Install returns a handle to it.
 */

#pragma once

#include "nb_notebook_finder.hpp"
#include <memory>

namespace nbimport {

class ImportSystem;

struct HookHandle {
    std::weak_ptr<NotebookFinder> finder;
    ImportSystem* imports{nullptr};

    std::shared_ptr<NotebookFinder> lock() const { return finder.lock(); }
    bool valid() const { return imports != nullptr && !finder.expired(); }
};

class NotebookImportHook {
public:
    static HookHandle Install(ImportSystem& imports);

    // Removes the finder from its chain. Returns false for an empty handle
    // or a finder that is no longer installed. The handle is reset.
    static bool Uninstall(HookHandle& handle);

    static std::shared_ptr<NotebookFinder> Find(const ImportSystem& imports);
    static bool IsInstalled(const ImportSystem& imports) { return Find(imports) != nullptr; }
};

} // namespace nbimport
