// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_builtins.hpp
 * @brief Native function registry for the script interpreter.
 *
 * Provides BuiltinRegistry for registering C++ functions callable from
 * cells and scripts, and RegisterCoreBuiltins() for the standard set
 * (print, str, len, type and the magic entry points the input
 * transformer emits).
 */

#pragma once

#include "nb_value.hpp"
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace nbimport {

// Forward declarations
class Interpreter;

// ============================================================================
// Native Function Types
// ============================================================================

// Standalone native function: (Interpreter&, args) -> Value
using BuiltinFn = std::function<Value(Interpreter&, std::span<Value>)>;

struct BuiltinFunction {
    std::string name;
    BuiltinFn func;
    int param_count{-1};  // -1 means variadic
};

// ============================================================================
// Builtin Registry
// ============================================================================

class BuiltinRegistry {
public:
    BuiltinRegistry() = default;

    // Prevent copying
    BuiltinRegistry(const BuiltinRegistry&) = delete;
    BuiltinRegistry& operator=(const BuiltinRegistry&) = delete;

    // Register (or replace) a native function
    void register_function(const std::string& name, BuiltinFn func, int param_count = -1);

    // Find a registered function (returns nullptr if not found)
    std::shared_ptr<BuiltinFunction> find_function(const std::string& name) const;

    bool has_function(const std::string& name) const;
    void unregister_function(const std::string& name);

    void clear();
    std::vector<std::string> get_function_names() const;
    size_t function_count() const { return functions_.size(); }

private:
    std::unordered_map<std::string, std::shared_ptr<BuiltinFunction>> functions_;
};

// print, str, len, type, __magic__, __cell_magic__
void RegisterCoreBuiltins(BuiltinRegistry& registry);

} // namespace nbimport
