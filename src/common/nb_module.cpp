#include "pch.h"
#include "nb_module.hpp"

namespace nbimport {

ModuleObject::ModuleObject(std::string name, std::filesystem::path file,
                           std::shared_ptr<IModuleLoader> loader)
    : name_(std::move(name))
    , file_(std::move(file))
    , loader_(std::move(loader))
    , bindings_(std::make_shared<Namespace>(name_)) {}

std::string ModuleObject::to_string() const {
    if (file_.empty()) {
        return "<module '" + name_ + "'>";
    }
    return "<module '" + name_ + "' from '" + file_.string() + "'>";
}

void ModuleRegistry::Register(const std::string& name, ModulePtr module) {
    modules_[name] = std::move(module);
}

ModulePtr ModuleRegistry::Lookup(const std::string& name) const {
    auto it = modules_.find(name);
    return it != modules_.end() ? it->second : nullptr;
}

bool ModuleRegistry::Contains(const std::string& name) const {
    return modules_.find(name) != modules_.end();
}

bool ModuleRegistry::Unregister(const std::string& name) {
    return modules_.erase(name) > 0;
}

std::vector<std::string> ModuleRegistry::Names() const {
    std::vector<std::string> names;
    names.reserve(modules_.size());
    for (const auto& [name, _] : modules_) {
        names.push_back(name);
    }
    return names;
}

} // namespace nbimport
