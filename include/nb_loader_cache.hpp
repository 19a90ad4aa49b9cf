// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_loader_cache.hpp
 * @brief Per-search-path loader cache.
 *
 * Holds at most one loader per normalized search-path key for the lifetime
 * of the owning finder. Entries are inserted lazily and never evicted.
 */

#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

namespace nbimport {

template <typename Loader>
class LoaderCache {
public:
    using LoaderPtr = std::shared_ptr<Loader>;

    // Existing loader for `key`, or the one `factory()` builds (then cached).
    template <typename Factory>
    LoaderPtr GetOrCreate(const std::string& key, Factory&& factory) {
        if (auto it = loaders_.find(key); it != loaders_.end()) {
            return it->second;
        }
        LoaderPtr loader = std::forward<Factory>(factory)();
        loaders_.emplace(key, loader);
        return loader;
    }

    LoaderPtr Find(const std::string& key) const {
        auto it = loaders_.find(key);
        return it != loaders_.end() ? it->second : nullptr;
    }

    size_t size() const { return loaders_.size(); }
    bool empty() const { return loaders_.empty(); }

private:
    std::unordered_map<std::string, LoaderPtr> loaders_;
};

} // namespace nbimport
