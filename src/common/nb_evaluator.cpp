#include "pch.h"
#include "nb_evaluator.hpp"
#include "nb_log.hpp"
#include "nb_parser.hpp"

namespace nbimport {

ScriptEvaluator::ScriptEvaluator(ImportSystem& imports, InterpreterConfig config)
    : imports_(imports)
    , config_(config) {}

void ScriptEvaluator::Execute(const std::string& source, const std::string& origin, const NamespacePtr& ns) {
    NB_LOG_DEBUG("executing " << origin << " in '" << ns->name() << "'");

    auto program = std::make_shared<Program>(Parse(source, origin));

    // One interpreter per unit of code
    Interpreter interpreter(imports_, config_);
    interpreter.run(std::move(program), ns);
}

} // namespace nbimport
