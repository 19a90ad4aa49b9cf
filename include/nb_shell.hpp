// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_shell.hpp
 * @brief Interactive execution context: ambient namespace, magics, output.
 *
 * The shell owns the user namespace and tracks which namespace is
 * "ambient", i.e. where magics and interactive cells act. Loaders swap a
 * module's namespace in for the duration of an import through
 * AmbientNamespaceScope.
 */

#pragma once

#include "nb_builtins.hpp"
#include "nb_evaluator.hpp"
#include "nb_input_transformer.hpp"
#include "nb_value.hpp"
#include <functional>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace nbimport {

class ImportSystem;
class Shell;

using LineMagicFn = std::function<void(Shell&, const std::string& args)>;
using CellMagicFn = std::function<void(Shell&, const std::string& args, const std::string& body)>;

class Shell {
public:
    explicit Shell(ImportSystem& imports);
    ~Shell();

    // Prevent copying
    Shell(const Shell&) = delete;
    Shell& operator=(const Shell&) = delete;

    // ---- Namespaces ----
    const NamespacePtr& user_namespace() const { return user_ns_; }
    const NamespacePtr& ambient_namespace() const { return ambient_ns_; }

    // nullptr restores the user namespace.
    void set_ambient_namespace(NamespacePtr ns);

    // Number of live AmbientNamespaceScope objects.
    size_t ambient_depth() const { return ambient_depth_; }

    // ---- Execution ----
    std::string TransformCell(std::string_view raw) const;

    // Transform `raw` and execute it in the ambient namespace.
    void RunCell(const std::string& raw, const std::string& origin = "<cell>");

    // ---- Magics ----
    void RunLineMagic(const std::string& name, const std::string& args);
    void RunCellMagic(const std::string& name, const std::string& args, const std::string& body);

    void register_line_magic(const std::string& name, LineMagicFn fn);
    void register_cell_magic(const std::string& name, CellMagicFn fn);
    bool has_line_magic(const std::string& name) const { return line_magics_.count(name) > 0; }
    bool has_cell_magic(const std::string& name) const { return cell_magics_.count(name) > 0; }
    std::vector<std::string> line_magic_names() const;

    // ---- Collaborators ----
    IEvaluator& evaluator() { return *evaluator_; }
    void set_evaluator(std::unique_ptr<IEvaluator> evaluator);

    BuiltinRegistry& builtins() { return builtins_; }
    const InputTransformer& input_transformer() const { return transformer_; }

    std::ostream& output() { return *output_; }
    void set_output(std::ostream& out) { output_ = &out; }

    ImportSystem& imports() { return imports_; }

private:
    friend class AmbientNamespaceScope;

    ImportSystem& imports_;
    NamespacePtr user_ns_;
    NamespacePtr ambient_ns_;
    size_t ambient_depth_{0};

    std::unique_ptr<IEvaluator> evaluator_;
    BuiltinRegistry builtins_;
    InputTransformer transformer_;
    std::ostream* output_;

    std::map<std::string, LineMagicFn> line_magics_;
    std::map<std::string, CellMagicFn> cell_magics_;
};

// Makes `ns` the shell's ambient namespace for the lifetime of the scope and
// restores the previous one on destruction, including during unwinding.
// Scopes nest in LIFO order.
class AmbientNamespaceScope {
public:
    AmbientNamespaceScope(Shell& shell, NamespacePtr ns);
    ~AmbientNamespaceScope();

    AmbientNamespaceScope(const AmbientNamespaceScope&) = delete;
    AmbientNamespaceScope& operator=(const AmbientNamespaceScope&) = delete;

    const NamespacePtr& saved() const { return saved_; }

private:
    Shell& shell_;
    NamespacePtr saved_;
};

// who, reset, echo, pwd, run, %%writefile
void RegisterCoreMagics(Shell& shell);

} // namespace nbimport
