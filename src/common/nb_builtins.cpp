#include "pch.h"
#include "nb_builtins.hpp"
#include "nb_errors.hpp"
#include "nb_interpreter.hpp"
#include "nb_shell.hpp"

namespace nbimport {

// ============================================================================
// BuiltinRegistry Implementation
// ============================================================================

void BuiltinRegistry::register_function(const std::string& name, BuiltinFn func, int param_count) {
    auto fn = std::make_shared<BuiltinFunction>();
    fn->name = name;
    fn->func = std::move(func);
    fn->param_count = param_count;
    functions_[name] = std::move(fn);
}

std::shared_ptr<BuiltinFunction> BuiltinRegistry::find_function(const std::string& name) const {
    auto it = functions_.find(name);
    if (it != functions_.end()) {
        return it->second;
    }
    return nullptr;
}

bool BuiltinRegistry::has_function(const std::string& name) const {
    return functions_.find(name) != functions_.end();
}

void BuiltinRegistry::unregister_function(const std::string& name) {
    functions_.erase(name);
}

void BuiltinRegistry::clear() {
    functions_.clear();
}

std::vector<std::string> BuiltinRegistry::get_function_names() const {
    std::vector<std::string> names;
    names.reserve(functions_.size());
    for (const auto& [name, _] : functions_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

// ============================================================================
// Core builtins
// ============================================================================

namespace {

const std::string& expect_string(std::span<Value> args, size_t index, const char* fn) {
    if (!args[index].is_string()) {
        throw RuntimeError(std::string(fn) + "() expects a String as argument " +
                           std::to_string(index + 1) + ", got " + args[index].type_name());
    }
    return args[index].as_string();
}

} // anonymous namespace

void RegisterCoreBuiltins(BuiltinRegistry& registry) {
    registry.register_function("print", [](Interpreter& interp, std::span<Value> args) -> Value {
        std::ostream& out = interp.shell().output();
        for (size_t i = 0; i < args.size(); ++i) {
            if (i > 0) out << " ";
            out << args[i].to_string();
        }
        out << "\n";
        return Value::null();
    });

    registry.register_function("str", [](Interpreter&, std::span<Value> args) -> Value {
        return Value::from_string(args[0].to_string());
    }, 1);

    registry.register_function("len", [](Interpreter&, std::span<Value> args) -> Value {
        const std::string& s = expect_string(args, 0, "len");
        return Value::from_int(static_cast<Int>(s.size()));
    }, 1);

    registry.register_function("type", [](Interpreter&, std::span<Value> args) -> Value {
        return Value::from_string(args[0].type_name());
    }, 1);

    // Emitted by InputTransformer for `%name args`
    registry.register_function("__magic__", [](Interpreter& interp, std::span<Value> args) -> Value {
        const std::string& name = expect_string(args, 0, "__magic__");
        const std::string& line = expect_string(args, 1, "__magic__");
        interp.shell().RunLineMagic(name, line);
        return Value::null();
    }, 2);

    // Emitted by InputTransformer for a `%%name args` cell
    registry.register_function("__cell_magic__", [](Interpreter& interp, std::span<Value> args) -> Value {
        const std::string& name = expect_string(args, 0, "__cell_magic__");
        const std::string& line = expect_string(args, 1, "__cell_magic__");
        const std::string& body = expect_string(args, 2, "__cell_magic__");
        interp.shell().RunCellMagic(name, line, body);
        return Value::null();
    }, 3);
}

} // namespace nbimport
