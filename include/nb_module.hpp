// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_module.hpp
 * @brief Module objects, loader/finder interfaces and the module registry.
 *
 * A finder maps a dotted module name and a search path to a loader; the
 * loader materializes the module. Loaded modules are owned by the
 * ModuleRegistry of their ImportSystem.
 */

#pragma once

#include "nb_value.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace nbimport {

class IModuleLoader;

// Ordered list of directories to search. Empty means the current directory.
using SearchPath = std::vector<std::string>;

class ModuleObject {
public:
    ModuleObject(std::string name, std::filesystem::path file, std::shared_ptr<IModuleLoader> loader);

    const std::string& name() const { return name_; }
    const std::filesystem::path& file() const { return file_; }
    const std::shared_ptr<IModuleLoader>& loader() const { return loader_; }

    // Namespace cells execute in. Shared so functions can refer back to it.
    const NamespacePtr& bindings() const { return bindings_; }

    std::string to_string() const;

private:
    std::string name_;
    std::filesystem::path file_;
    std::shared_ptr<IModuleLoader> loader_;
    NamespacePtr bindings_;
};

using ModulePtr = std::shared_ptr<ModuleObject>;

class IModuleLoader {
public:
    virtual ~IModuleLoader() = default;
    virtual ModulePtr LoadModule(const std::string& fullname) = 0;
};

class IModuleFinder {
public:
    virtual ~IModuleFinder() = default;

    // Returns nullptr to decline the name.
    virtual std::shared_ptr<IModuleLoader> FindModule(const std::string& fullname,
                                                      const SearchPath& path) = 0;
    virtual std::string Name() const = 0;
};

// Fully qualified module name -> loaded module.
class ModuleRegistry {
public:
    void Register(const std::string& name, ModulePtr module);
    ModulePtr Lookup(const std::string& name) const;
    bool Contains(const std::string& name) const;
    bool Unregister(const std::string& name);

    std::vector<std::string> Names() const;
    size_t size() const { return modules_.size(); }
    void clear() { modules_.clear(); }

private:
    std::map<std::string, ModulePtr> modules_;
};

} // namespace nbimport
