#include "pch.h"
#include "nb_shell.hpp"
#include "nb_errors.hpp"
#include "nb_log.hpp"

namespace nbimport {

// ============================================================
//  Shell
// ============================================================

Shell::Shell(ImportSystem& imports)
    : imports_(imports)
    , user_ns_(std::make_shared<Namespace>("__main__"))
    , ambient_ns_(user_ns_)
    , evaluator_(std::make_unique<ScriptEvaluator>(imports))
    , output_(&std::cout) {
    user_ns_->set("__name__", Value::from_string("__main__"));
    RegisterCoreBuiltins(builtins_);
    RegisterCoreMagics(*this);
}

Shell::~Shell() = default;

void Shell::set_ambient_namespace(NamespacePtr ns) {
    ambient_ns_ = ns ? std::move(ns) : user_ns_;
}

std::string Shell::TransformCell(std::string_view raw) const {
    return transformer_.TransformCell(raw);
}

void Shell::RunCell(const std::string& raw, const std::string& origin) {
    // Hold the namespace: a magic inside the cell may swap the ambient one.
    NamespacePtr ns = ambient_ns_;
    evaluator_->Execute(TransformCell(raw), origin, ns);
}

void Shell::RunLineMagic(const std::string& name, const std::string& args) {
    auto it = line_magics_.find(name);
    if (it == line_magics_.end()) {
        throw RuntimeError("Line magic function `%" + name + "` not found.");
    }
    NB_LOG_DEBUG("line magic %" << name << " " << args);
    it->second(*this, args);
}

void Shell::RunCellMagic(const std::string& name, const std::string& args, const std::string& body) {
    auto it = cell_magics_.find(name);
    if (it == cell_magics_.end()) {
        throw RuntimeError("Cell magic `%%" + name + "` not found.");
    }
    NB_LOG_DEBUG("cell magic %%" << name << " " << args);
    it->second(*this, args, body);
}

void Shell::register_line_magic(const std::string& name, LineMagicFn fn) {
    line_magics_[name] = std::move(fn);
}

void Shell::register_cell_magic(const std::string& name, CellMagicFn fn) {
    cell_magics_[name] = std::move(fn);
}

std::vector<std::string> Shell::line_magic_names() const {
    std::vector<std::string> names;
    names.reserve(line_magics_.size());
    for (const auto& [name, _] : line_magics_) {
        names.push_back(name);
    }
    return names;
}

void Shell::set_evaluator(std::unique_ptr<IEvaluator> evaluator) {
    if (!evaluator) {
        throw std::invalid_argument("Shell::set_evaluator: evaluator must not be null");
    }
    evaluator_ = std::move(evaluator);
}

// ============================================================
//  AmbientNamespaceScope
// ============================================================

AmbientNamespaceScope::AmbientNamespaceScope(Shell& shell, NamespacePtr ns)
    : shell_(shell)
    , saved_(shell.ambient_ns_) {
    shell_.set_ambient_namespace(std::move(ns));
    ++shell_.ambient_depth_;
}

AmbientNamespaceScope::~AmbientNamespaceScope() {
    shell_.ambient_ns_ = std::move(saved_);
    --shell_.ambient_depth_;
}

} // namespace nbimport
