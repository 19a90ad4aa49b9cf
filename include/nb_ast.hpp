// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_ast.hpp
 * @brief Syntax tree of an nbscript cell.
 *
 * Expr and Stmt wrap a std::variant of node structs; consumers branch with
 * std::get_if. Children are owned through unique_ptr. Each node records the
 * line it starts on for runtime diagnostics.
 */

#pragma once

#include "nb_value.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace nbimport {

struct Expr;
struct Stmt;
using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;
using StmtList = std::vector<StmtPtr>;

enum class UnaryOp : uint8_t { Negate, Not };

enum class BinaryOp : uint8_t {
    Add, Sub, Mul, Div, Mod,
    Eq, Ne, Lt, Gt, Le, Ge,
    And, Or,
};

inline const char* symbol(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add: return "+";
        case BinaryOp::Sub: return "-";
        case BinaryOp::Mul: return "*";
        case BinaryOp::Div: return "/";
        case BinaryOp::Mod: return "%";
        case BinaryOp::Eq:  return "==";
        case BinaryOp::Ne:  return "!=";
        case BinaryOp::Lt:  return "<";
        case BinaryOp::Gt:  return ">";
        case BinaryOp::Le:  return "<=";
        case BinaryOp::Ge:  return ">=";
        case BinaryOp::And: return "&&";
        case BinaryOp::Or:  return "||";
    }
    return "?";
}

namespace ast {

// ---- Expressions ----

struct Literal { Value value; };
struct Name { std::string id; };
struct Unary { UnaryOp op; ExprPtr operand; };
struct Binary { BinaryOp op; ExprPtr lhs; ExprPtr rhs; };
struct Call { ExprPtr callee; std::vector<ExprPtr> args; };
struct Member { ExprPtr object; std::string name; };

// `target = value`, or `target op= value` when `compound` is set.
struct Assign {
    std::string target;
    std::optional<BinaryOp> compound;
    ExprPtr value;
};

// ---- Statements ----

struct Eval { ExprPtr expr; };

// `var name = init` or `let name = init`; `let` bindings are constant.
struct Bind {
    std::string name;
    ExprPtr init;
    bool constant{false};
};

struct Block { StmtList body; };

// `else if` chains nest as a single If inside else_body.
struct If {
    ExprPtr cond;
    StmtList then_body;
    StmtList else_body;
};

struct While { ExprPtr cond; StmtList body; };

struct Function {
    std::string name;
    std::vector<std::string> params;
    StmtList body;
};

struct Return { ExprPtr value; };  // value may be null

// `import a.b.c` binds the module to `alias` ("c").
struct Import { std::string module; std::string alias; };

struct Throw { ExprPtr value; };

} // namespace ast

struct Expr {
    using Node = std::variant<ast::Literal, ast::Name, ast::Unary, ast::Binary,
                              ast::Call, ast::Member, ast::Assign>;
    Node node;
    uint32_t line{0};
};

struct Stmt {
    using Node = std::variant<ast::Eval, ast::Bind, ast::Block, ast::If, ast::While,
                              ast::Function, ast::Return, ast::Import, ast::Throw>;
    Node node;
    uint32_t line{0};
};

using Program = StmtList;

} // namespace nbimport
