// src/evaluator/FunctionCall.cpp
#include <algorithm>
#include <map>

#include "MicaError.hpp"
#include "evaluator.hpp"

namespace {

// Tracks one active call; released on every exit path.
class CallDepthGuard {
   public:
    CallDepthGuard(size_t& depth, size_t limit, const Token& callToken) : depth_(depth) {
        if (depth_ >= limit) {
            throw EvalError(EvalError::Kind::CallDepthExceeded,
                "Maximum call depth of " + std::to_string(limit) + " exceeded",
                callToken.loc);
        }
        ++depth_;
    }
    ~CallDepthGuard() { --depth_; }
    CallDepthGuard(const CallDepthGuard&) = delete;
    CallDepthGuard& operator=(const CallDepthGuard&) = delete;

   private:
    size_t& depth_;
};

}  // namespace

Value Evaluator::evaluate_function_declaration(FunctionDeclarationNode* node, EnvPtr env) {
    // The value keeps its own copy of the declaration so it outlives the
    // Program it was parsed from (REPL lines are freed after evaluation).
    std::shared_ptr<FunctionDeclarationNode> body(node->clone_declaration().release());
    auto fn = std::make_shared<FunctionValue>(node->name, node->parameters, body, env, node->token);

    try {
        return env->declare(node->name, fn, true);
    } catch (const EnvError& e) {
        throw EnvError(e.kind(), e.name(), node->token.loc);
    }
}

Value Evaluator::evaluate_call(CallExpressionNode* node, EnvPtr env) {
    std::vector<Value> args;
    args.reserve(node->arguments.size());
    for (auto& a : node->arguments) {
        args.push_back(evaluate_expression(a.get(), env));
    }

    Value calleeVal = evaluate_expression(node->callee.get(), env);
    if (!std::holds_alternative<FunctionPtr>(calleeVal) || !std::get<FunctionPtr>(calleeVal)) {
        throw EvalError(EvalError::Kind::ValueNotAFunction,
            "'" + node->callee->to_string() + "' is not a function (got " + value_to_string(calleeVal) + ")",
            node->token.loc);
    }

    return call_function(std::get<FunctionPtr>(calleeVal), args, env, node->token);
}

Value Evaluator::call_function(FunctionPtr fn, const std::vector<Value>& args, EnvPtr caller_env, const Token& callToken) {
    CallDepthGuard guard(call_depth, options_.max_call_depth, callToken);

    // Native function: call the C++ implementation with the caller's scope.
    if (fn->is_native) {
        if (!fn->native_impl) {
            throw EvalError(EvalError::Kind::ValueNotAFunction,
                "Native function '" + fn->name + "' has no implementation",
                callToken.loc);
        }
        return fn->native_impl(args, caller_env);
    }

    if (args.size() != fn->parameters.size()) {
        throw EvalError(EvalError::Kind::ArityMismatch,
            "Function '" + fn->name + "' expects " + std::to_string(fn->parameters.size()) +
                " argument(s) but got " + std::to_string(args.size()),
            callToken.loc);
    }

    auto local = std::make_shared<Environment>(fn->closure);
    for (size_t i = 0; i < fn->parameters.size(); ++i) {
        local->declare(fn->parameters[i], args[i], false);
    }

    Value result = std::monostate{};
    try {
        if (fn->body) {
            for (auto& stmt : fn->body->body) {
                result = evaluate_statement(stmt.get(), local);
            }
        }
    } catch (...) {
        release_call_scope(local);
        throw;
    }
    release_call_scope(local);
    return result;
}

// A call scope is garbage once the only references left to it are closures
// of functions it binds itself and that nothing else holds. Clearing those
// bindings frees it; a scope reachable from elsewhere is kept for ~Evaluator.
void Evaluator::release_call_scope(EnvPtr& local) {
    std::map<const FunctionValue*, long> bound;
    for (const auto& kv : local->values) {
        if (auto fn = std::get_if<FunctionPtr>(&kv.second.value)) {
            if (*fn && (*fn)->closure == local) ++bound[fn->get()];
        }
    }

    long self_refs = 0;
    for (const auto& kv : local->values) {
        auto fn = std::get_if<FunctionPtr>(&kv.second.value);
        if (!fn || !*fn || (*fn)->closure != local) continue;
        auto it = bound.find(fn->get());
        if (it != bound.end() && fn->use_count() == it->second) {
            ++self_refs;
            bound.erase(it);
        }
    }

    if (local.use_count() - 1 == self_refs) {
        if (self_refs > 0) {
            std::unordered_map<std::string, Environment::Variable> doomed;
            doomed.swap(local->values);
        }
        return;
    }

    if (retained_scopes.size() >= retained_prune_at) {
        retained_scopes.erase(
            std::remove_if(retained_scopes.begin(), retained_scopes.end(),
                [](const std::weak_ptr<Environment>& w) { return w.expired(); }),
            retained_scopes.end());
        retained_prune_at = std::max<size_t>(64, retained_scopes.size() * 2);
    }
    retained_scopes.push_back(local);
}
