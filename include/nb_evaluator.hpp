// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_evaluator.hpp
 * @brief Executes source text against a namespace.
 */

#pragma once

#include "nb_interpreter.hpp"
#include "nb_value.hpp"
#include <string>

namespace nbimport {

class ImportSystem;

class IEvaluator {
public:
    virtual ~IEvaluator() = default;

    // Runs `source` with `ns` as the global scope. `origin` names the code
    // for diagnostics ("<path> [cell 3]", "<stdin>"). Script failures are
    // raised as ScriptError.
    virtual void Execute(const std::string& source, const std::string& origin, const NamespacePtr& ns) = 0;
};

// Lexes, parses and interprets nbscript source.
class ScriptEvaluator : public IEvaluator {
public:
    explicit ScriptEvaluator(ImportSystem& imports, InterpreterConfig config = InterpreterConfig{});

    void Execute(const std::string& source, const std::string& origin, const NamespacePtr& ns) override;

private:
    ImportSystem& imports_;
    InterpreterConfig config_;
};

} // namespace nbimport
