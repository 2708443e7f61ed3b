// src/evaluator/Evaluator.cpp
#include "evaluator.hpp"

#include <iostream>
#include <sstream>

#include "MicaError.hpp"
#include "builtins.hpp"

Evaluator::Evaluator() : Evaluator(default_builtins(std::cout)) {
}

Evaluator::Evaluator(const BuiltinRegistry& registry, EvaluatorOptions options)
    : global_env(std::make_shared<Environment>(nullptr)), options_(options) {
    init_globals(registry);
}

Evaluator::~Evaluator() {
    // Bindings are moved out before they are destroyed, so a scope is never
    // mutated while its own values are being torn down.
    for (auto& weak : retained_scopes) {
        if (EnvPtr scope = weak.lock()) {
            std::unordered_map<std::string, Environment::Variable> doomed;
            doomed.swap(scope->values);
        }
    }
    std::unordered_map<std::string, Environment::Variable> doomed;
    doomed.swap(global_env->values);
}

Evaluator::DepthGuard::DepthGuard(Evaluator& ev, const Token& at) : evaluator(ev) {
    if (evaluator.eval_depth >= evaluator.options_.max_eval_depth) {
        throw EvalError(EvalError::Kind::EvaluationTooDeep,
            "Evaluation is deeper than the limit of " + std::to_string(evaluator.options_.max_eval_depth),
            at.loc);
    }
    ++evaluator.eval_depth;
}

Evaluator::DepthGuard::~DepthGuard() {
    --evaluator.eval_depth;
}

void Evaluator::init_globals(const BuiltinRegistry& registry) {
    global_env->declare("true", true, true);
    global_env->declare("false", false, true);
    global_env->declare("null", std::monostate{}, true);

    for (const auto& entry : registry.entries()) {
        Token tok(TokenType::IDENTIFIER, entry.name, TokenLocation("<builtin>", 0, 0, 0));
        auto fn = std::make_shared<FunctionValue>(entry.name, entry.fn, tok);
        global_env->declare(entry.name, fn, true);
    }
}

// ----------------- Program evaluation -----------------
Value Evaluator::evaluate(ProgramNode* program) {
    return evaluate(program, global_env);
}

Value Evaluator::evaluate(ProgramNode* program, EnvPtr env) {
    Value last = std::monostate{};
    if (!program) return last;
    if (!env) env = global_env;

    for (auto& stmt_uptr : program->body) {
        last = evaluate_statement(stmt_uptr.get(), env);
    }
    return last;
}

bool Evaluator::is_void(const Value& v) {
    return std::holds_alternative<std::monostate>(v);
}

std::string Evaluator::value_to_string(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return "null";
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? "true" : "false";
    if (std::holds_alternative<std::int64_t>(v)) return std::to_string(std::get<std::int64_t>(v));
    if (std::holds_alternative<FunctionPtr>(v)) {
        FunctionPtr fn = std::get<FunctionPtr>(v);
        if (!fn) return "[fn]";
        return std::string(fn->is_native ? "[native fn " : "[fn ") + fn->name + "]";
    }

    ObjectPtr op = std::get<ObjectPtr>(v);
    if (!op || op->properties.empty()) return "{}";
    std::ostringstream ss;
    ss << "{ ";
    bool first = true;
    for (const auto& kv : op->properties) {
        if (!first) ss << ", ";
        first = false;
        ss << kv.first << ": " << value_to_string(kv.second);
    }
    ss << " }";
    return ss.str();
}

bool values_equal(const Value& a, const Value& b) {
    if (a.index() != b.index()) return false;
    if (std::holds_alternative<std::monostate>(a)) return true;
    if (std::holds_alternative<bool>(a)) return std::get<bool>(a) == std::get<bool>(b);
    if (std::holds_alternative<std::int64_t>(a)) return std::get<std::int64_t>(a) == std::get<std::int64_t>(b);
    if (std::holds_alternative<FunctionPtr>(a)) return std::get<FunctionPtr>(a) == std::get<FunctionPtr>(b);

    ObjectPtr oa = std::get<ObjectPtr>(a);
    ObjectPtr ob = std::get<ObjectPtr>(b);
    if (oa == ob) return true;
    if (!oa || !ob) return false;
    if (oa->properties.size() != ob->properties.size()) return false;
    for (const auto& kv : oa->properties) {
        auto it = ob->properties.find(kv.first);
        if (it == ob->properties.end()) return false;
        if (!values_equal(kv.second, it->second)) return false;
    }
    return true;
}
