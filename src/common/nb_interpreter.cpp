#include "pch.h"
#include "nb_interpreter.hpp"
#include "nb_builtins.hpp"
#include "nb_import_system.hpp"
#include "nb_module.hpp"
#include "nb_shell.hpp"

namespace nbimport {

namespace {

template <typename T>
bool compare(BinaryOp op, const T& a, const T& b) {
    switch (op) {
        case BinaryOp::Lt: return a < b;
        case BinaryOp::Gt: return a > b;
        case BinaryOp::Le: return a <= b;
        case BinaryOp::Ge: return a >= b;
        default:           return false;
    }
}

// Integer arithmetic. Results outside the Int range raise instead of wrapping.
Value int_arithmetic(BinaryOp op, Int a, Int b, uint32_t line) {
    constexpr Int kMin = std::numeric_limits<Int>::min();
    Int result = 0;
    bool overflow = false;

    switch (op) {
        case BinaryOp::Add: overflow = __builtin_add_overflow(a, b, &result); break;
        case BinaryOp::Sub: overflow = __builtin_sub_overflow(a, b, &result); break;
        case BinaryOp::Mul: overflow = __builtin_mul_overflow(a, b, &result); break;
        case BinaryOp::Div:
            if (b == 0) throw RuntimeError("Division by zero", line);
            overflow = (a == kMin && b == -1);
            if (!overflow) result = a / b;
            break;
        case BinaryOp::Mod:
            if (b == 0) throw RuntimeError("Division by zero", line);
            result = (b == -1) ? 0 : a % b;
            break;
        default:
            throw RuntimeError(std::string("Unsupported integer operator '") + symbol(op) + "'", line);
    }

    if (overflow) {
        throw RuntimeError("Integer overflow", line);
    }
    return Value::from_int(result);
}

} // anonymous namespace

Interpreter::Interpreter(ImportSystem& imports, InterpreterConfig config)
    : imports_(imports)
    , config_(config) {}

Shell& Interpreter::shell() {
    return imports_.shell();
}

// ============================================================
//  Entry points
// ============================================================

void Interpreter::run(std::shared_ptr<const Program> program, const NamespacePtr& globals) {
    if (!program || !globals) {
        throw std::invalid_argument("Interpreter::run requires a program and a namespace");
    }

    program_ = std::move(program);
    Scope scope{globals, nullptr};
    for (const auto& stmt : *program_) {
        if (execute(*stmt, scope) == Flow::Return) {
            throw RuntimeError("'return' outside of a function", stmt->line);
        }
    }
}

Value Interpreter::call(const Value& callee, std::vector<Value> args, uint32_t line) {
    if (callee.is_builtin()) {
        const auto& fn = callee.as_builtin();
        if (fn->param_count >= 0 && args.size() != static_cast<size_t>(fn->param_count)) {
            throw RuntimeError(fn->name + "() expects " + std::to_string(fn->param_count) +
                               " argument(s), got " + std::to_string(args.size()), line);
        }
        return fn->func(*this, std::span<Value>(args));
    }
    if (callee.is_function()) {
        return call_function(*callee.as_function(), args, line);
    }
    throw RuntimeError(std::string("Value of type ") + callee.type_name() + " is not callable", line);
}

Value Interpreter::call_function(const FunctionObject& fn, std::vector<Value>& args, uint32_t line) {
    const auto& params = fn.decl->params;
    if (args.size() != params.size()) {
        throw RuntimeError(fn.name + "() expects " + std::to_string(params.size()) +
                           " argument(s), got " + std::to_string(args.size()), line);
    }

    NamespacePtr globals = fn.globals.lock();
    if (!globals) {
        throw RuntimeError("function '" + fn.name + "' outlived the namespace it was defined in", line);
    }
    if (call_depth_ >= config_.max_call_depth) {
        throw RuntimeError("Maximum call depth exceeded in '" + fn.name + "'", line);
    }

    Frame frame;
    for (size_t i = 0; i < params.size(); ++i) {
        frame.values[params[i]] = std::move(args[i]);
    }
    Scope scope{globals, &frame};

    // Declarations made while the body runs belong to the callee's program.
    std::shared_ptr<const Program> saved_program = program_;
    program_ = fn.program;
    ++call_depth_;

    Flow flow = Flow::Normal;
    try {
        flow = execute_list(fn.decl->body, scope);
    } catch (...) {
        --call_depth_;
        program_ = std::move(saved_program);
        throw;
    }
    --call_depth_;
    program_ = std::move(saved_program);

    if (flow == Flow::Return) {
        Value result = std::move(return_value_);
        return_value_ = Value::null();
        return result;
    }
    return Value::null();
}

// ============================================================
//  Statements
// ============================================================

Interpreter::Flow Interpreter::execute(const Stmt& stmt, Scope& scope) {
    const Stmt::Node& node = stmt.node;

    if (auto* s = std::get_if<ast::Eval>(&node)) {
        evaluate(*s->expr, scope);
        return Flow::Normal;
    }
    if (auto* s = std::get_if<ast::Bind>(&node)) {
        Value value = s->init ? evaluate(*s->init, scope) : Value::null();
        bind(s->name, std::move(value), scope, s->constant);
        return Flow::Normal;
    }
    if (auto* s = std::get_if<ast::Block>(&node)) {
        return execute_list(s->body, scope);
    }
    if (auto* s = std::get_if<ast::If>(&node)) {
        if (evaluate(*s->cond, scope).is_truthy()) {
            return execute_list(s->then_body, scope);
        }
        return execute_list(s->else_body, scope);
    }
    if (auto* s = std::get_if<ast::While>(&node)) {
        while (evaluate(*s->cond, scope).is_truthy()) {
            if (execute_list(s->body, scope) == Flow::Return) {
                return Flow::Return;
            }
        }
        return Flow::Normal;
    }
    if (auto* s = std::get_if<ast::Function>(&node)) {
        execute_function(*s, scope);
        return Flow::Normal;
    }
    if (auto* s = std::get_if<ast::Return>(&node)) {
        return_value_ = s->value ? evaluate(*s->value, scope) : Value::null();
        return Flow::Return;
    }
    if (auto* s = std::get_if<ast::Import>(&node)) {
        execute_import(*s, scope);
        return Flow::Normal;
    }
    if (auto* s = std::get_if<ast::Throw>(&node)) {
        Value payload = evaluate(*s->value, scope);
        throw ThrownError(payload.to_string(), stmt.line);
    }
    throw RuntimeError("Unknown statement", stmt.line);
}

Interpreter::Flow Interpreter::execute_list(const StmtList& body, Scope& scope) {
    for (const auto& stmt : body) {
        if (execute(*stmt, scope) == Flow::Return) {
            return Flow::Return;
        }
    }
    return Flow::Normal;
}

void Interpreter::execute_function(const ast::Function& decl, Scope& scope) {
    auto fn = std::make_shared<FunctionObject>();
    fn->name = decl.name;
    fn->decl = &decl;
    fn->program = program_;
    fn->globals = scope.globals;
    bind(decl.name, Value::from_function(std::move(fn)), scope, false);
}

void Interpreter::execute_import(const ast::Import& decl, Scope& scope) {
    std::shared_ptr<ModuleObject> module = imports_.Import(decl.module);
    bind(decl.alias, Value::from_module(std::move(module)), scope, false);
}

// ============================================================
//  Expressions
// ============================================================

Value Interpreter::evaluate(const Expr& expr, Scope& scope) {
    const Expr::Node& node = expr.node;

    if (auto* e = std::get_if<ast::Literal>(&node)) return e->value;
    if (auto* e = std::get_if<ast::Name>(&node)) return lookup(e->id, scope, expr.line);
    if (auto* e = std::get_if<ast::Unary>(&node)) return evaluate_unary(*e, expr.line, scope);
    if (auto* e = std::get_if<ast::Binary>(&node)) return evaluate_binary(*e, expr.line, scope);
    if (auto* e = std::get_if<ast::Assign>(&node)) return evaluate_assign(*e, expr.line, scope);
    if (auto* e = std::get_if<ast::Call>(&node)) return evaluate_call(*e, expr.line, scope);
    if (auto* e = std::get_if<ast::Member>(&node)) return evaluate_member(*e, expr.line, scope);
    throw RuntimeError("Unknown expression", expr.line);
}

Value Interpreter::evaluate_unary(const ast::Unary& node, uint32_t line, Scope& scope) {
    Value operand = evaluate(*node.operand, scope);
    if (node.op == UnaryOp::Not) {
        return Value::from_bool(!operand.is_truthy());
    }
    if (operand.is_int()) {
        if (operand.as_int() == std::numeric_limits<Int>::min()) {
            throw RuntimeError("Integer overflow", line);
        }
        return Value::from_int(-operand.as_int());
    }
    if (operand.is_float()) return Value::from_float(-operand.as_float());
    throw RuntimeError(std::string("Unsupported operand type for unary '-': ") + operand.type_name(), line);
}

Value Interpreter::evaluate_binary(const ast::Binary& node, uint32_t line, Scope& scope) {
    // && and || short-circuit and always yield a Bool
    if (node.op == BinaryOp::And) {
        if (!evaluate(*node.lhs, scope).is_truthy()) return Value::from_bool(false);
        return Value::from_bool(evaluate(*node.rhs, scope).is_truthy());
    }
    if (node.op == BinaryOp::Or) {
        if (evaluate(*node.lhs, scope).is_truthy()) return Value::from_bool(true);
        return Value::from_bool(evaluate(*node.rhs, scope).is_truthy());
    }

    Value left = evaluate(*node.lhs, scope);
    Value right = evaluate(*node.rhs, scope);
    return apply_binary(node.op, left, right, line);
}

Value Interpreter::apply_binary(BinaryOp op, const Value& left, const Value& right, uint32_t line) {
    const bool both_int = left.is_int() && right.is_int();
    const bool both_number = left.is_number() && right.is_number();

    switch (op) {
        case BinaryOp::Add:
            if (both_int) return int_arithmetic(op, left.as_int(), right.as_int(), line);
            if (both_number) return Value::from_float(left.as_number() + right.as_number());
            if (left.is_string() || right.is_string()) {
                return Value::from_string(left.to_string() + right.to_string());
            }
            break;

        case BinaryOp::Sub:
        case BinaryOp::Mul:
        case BinaryOp::Div:
        case BinaryOp::Mod:
            if (both_int) return int_arithmetic(op, left.as_int(), right.as_int(), line);
            if (both_number) {
                const Float a = left.as_number();
                const Float b = right.as_number();
                if (op == BinaryOp::Sub) return Value::from_float(a - b);
                if (op == BinaryOp::Mul) return Value::from_float(a * b);
                if (op == BinaryOp::Div) return Value::from_float(a / b);
                return Value::from_float(std::fmod(a, b));
            }
            break;

        case BinaryOp::Eq:
            return Value::from_bool(left.equals(right));
        case BinaryOp::Ne:
            return Value::from_bool(!left.equals(right));

        case BinaryOp::Lt:
        case BinaryOp::Gt:
        case BinaryOp::Le:
        case BinaryOp::Ge:
            if (both_int) return Value::from_bool(compare(op, left.as_int(), right.as_int()));
            if (both_number) return Value::from_bool(compare(op, left.as_number(), right.as_number()));
            if (left.is_string() && right.is_string()) {
                return Value::from_bool(compare(op, left.as_string(), right.as_string()));
            }
            break;

        default:
            break;
    }

    throw RuntimeError(std::string("Unsupported operand types for '") + symbol(op) + "': " +
                       left.type_name() + " and " + right.type_name(), line);
}

Value Interpreter::evaluate_assign(const ast::Assign& node, uint32_t line, Scope& scope) {
    Value value = evaluate(*node.value, scope);
    if (node.compound) {
        Value current = lookup(node.target, scope, line);
        value = apply_binary(*node.compound, current, value, line);
    }
    assign(node.target, value, scope, line);
    return value;
}

Value Interpreter::evaluate_call(const ast::Call& node, uint32_t line, Scope& scope) {
    Value callee = evaluate(*node.callee, scope);

    std::vector<Value> args;
    args.reserve(node.args.size());
    for (const auto& arg : node.args) {
        args.push_back(evaluate(*arg, scope));
    }
    return call(callee, std::move(args), line);
}

Value Interpreter::evaluate_member(const ast::Member& node, uint32_t line, Scope& scope) {
    Value object = evaluate(*node.object, scope);
    if (!object.is_module()) {
        throw RuntimeError(std::string("Value of type ") + object.type_name() +
                           " has no member '" + node.name + "'", line);
    }

    const auto& module = object.as_module();
    const Value* member = module->bindings()->find(node.name);
    if (!member) {
        throw RuntimeError("module '" + module->name() + "' has no member '" + node.name + "'", line);
    }
    return *member;
}

// ============================================================
//  Variables
// ============================================================

Value Interpreter::lookup(const std::string& name, const Scope& scope, uint32_t line) const {
    if (scope.frame) {
        auto it = scope.frame->values.find(name);
        if (it != scope.frame->values.end()) {
            return it->second;
        }
    }
    if (const Value* global = scope.globals->find(name)) {
        return *global;
    }
    if (auto builtin = imports_.shell().builtins().find_function(name)) {
        return Value::from_builtin(std::move(builtin));
    }
    throw RuntimeError("Undefined variable '" + name + "'", line);
}

void Interpreter::assign(const std::string& name, Value value, Scope& scope, uint32_t line) {
    if (scope.frame) {
        auto it = scope.frame->values.find(name);
        if (it != scope.frame->values.end()) {
            if (scope.frame->constants.count(name)) {
                throw RuntimeError("Cannot assign to constant '" + name + "'", line);
            }
            it->second = std::move(value);
            return;
        }
        if (!scope.globals->contains(name)) {
            scope.frame->values[name] = std::move(value);
            return;
        }
    }

    if (scope.globals->is_constant(name)) {
        throw RuntimeError("Cannot assign to constant '" + name + "'", line);
    }
    scope.globals->set(name, std::move(value));
}

void Interpreter::bind(const std::string& name, Value value, Scope& scope, bool is_constant) {
    if (scope.frame) {
        scope.frame->values[name] = std::move(value);
        if (is_constant) {
            scope.frame->constants.insert(name);
        } else {
            scope.frame->constants.erase(name);
        }
        return;
    }

    if (is_constant) {
        scope.globals->define_constant(name, std::move(value));
    } else {
        scope.globals->set(name, std::move(value));
    }
}

} // namespace nbimport
