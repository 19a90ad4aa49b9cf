// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_interpreter.hpp
 * @brief Tree-walking interpreter for cells and scripts.
 *
 * Executes a parsed Program against a Namespace that serves as both the
 * read and the write scope of top-level statements. `import` statements
 * are delegated to the owning ImportSystem.
 */

#pragma once

#include "nb_ast.hpp"
#include "nb_errors.hpp"
#include "nb_value.hpp"
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace nbimport {

class ImportSystem;
class Shell;

// Script function. The declaration lives inside `program`, which is kept
// alive for as long as the function value is reachable.
struct FunctionObject {
    std::string name;
    const ast::Function* decl{nullptr};
    std::shared_ptr<const Program> program;
    std::weak_ptr<Namespace> globals;  // Module namespace the function was defined in
};

struct InterpreterConfig {
    size_t max_call_depth = 256;
};

class Interpreter {
public:
    explicit Interpreter(ImportSystem& imports, InterpreterConfig config = InterpreterConfig{});

    // Prevent copying
    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    // Run every statement of `program` with `globals` as the top-level scope.
    void run(std::shared_ptr<const Program> program, const NamespacePtr& globals);

    // Call a Function or Builtin value.
    Value call(const Value& callee, std::vector<Value> args, uint32_t line = 0);

    ImportSystem& imports() { return imports_; }
    Shell& shell();

private:
    // Locals of one function call
    struct Frame {
        std::unordered_map<std::string, Value> values;
        std::set<std::string> constants;
    };

    // Active scope: function frame (nullptr at top level) over module globals
    struct Scope {
        NamespacePtr globals;
        Frame* frame{nullptr};
    };

    enum class Flow { Normal, Return };

    ImportSystem& imports_;
    InterpreterConfig config_;
    std::shared_ptr<const Program> program_;
    Value return_value_;
    size_t call_depth_{0};

    // ---- Statements ----
    Flow execute(const Stmt& stmt, Scope& scope);
    Flow execute_list(const StmtList& body, Scope& scope);
    void execute_function(const ast::Function& decl, Scope& scope);
    void execute_import(const ast::Import& decl, Scope& scope);

    // ---- Expressions ----
    Value evaluate(const Expr& expr, Scope& scope);
    Value evaluate_unary(const ast::Unary& node, uint32_t line, Scope& scope);
    Value evaluate_binary(const ast::Binary& node, uint32_t line, Scope& scope);
    Value evaluate_assign(const ast::Assign& node, uint32_t line, Scope& scope);
    Value evaluate_call(const ast::Call& node, uint32_t line, Scope& scope);
    Value evaluate_member(const ast::Member& node, uint32_t line, Scope& scope);

    Value call_function(const FunctionObject& fn, std::vector<Value>& args, uint32_t line);

    // ---- Variables ----
    Value lookup(const std::string& name, const Scope& scope, uint32_t line) const;
    void assign(const std::string& name, Value value, Scope& scope, uint32_t line);
    void bind(const std::string& name, Value value, Scope& scope, bool is_constant);

    static Value apply_binary(BinaryOp op, const Value& left, const Value& right, uint32_t line);
};

} // namespace nbimport
