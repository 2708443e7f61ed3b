#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

// Forward declaration
class Environment;
class BuiltinRegistry;

// Environment
using EnvPtr = std::shared_ptr<Environment>;

// Our language's value types
struct FunctionValue;
using FunctionPtr = std::shared_ptr<FunctionValue>;

struct ObjectValue;
using ObjectPtr = std::shared_ptr<ObjectValue>;

using Value = std::variant<
    std::monostate,
    bool,
    std::int64_t,
    ObjectPtr,
    FunctionPtr>;

// Host function signature: arguments in call order plus the caller's scope.
using NativeFn = std::function<Value(const std::vector<Value>&, EnvPtr)>;

struct ObjectValue {
    // ordered so display and comparison are deterministic
    std::map<std::string, Value> properties;
};

struct FunctionValue {
    std::string name;
    std::vector<std::string> parameters;
    std::shared_ptr<FunctionDeclarationNode> body;
    EnvPtr closure;  // scope the function was declared in (shared, not copied); null for natives
    Token token;
    bool is_native = false;
    NativeFn native_impl;

    FunctionValue(
        const std::string& nm,
        const std::vector<std::string>& params,
        const std::shared_ptr<FunctionDeclarationNode>& b,
        const EnvPtr& env,
        const Token& tok) : name(nm),
                            parameters(params),
                            body(b),
                            closure(env),
                            token(tok),
                            is_native(false) {}

    // Native function constructor
    FunctionValue(
        const std::string& nm,
        const NativeFn& impl,
        const Token& tok) : name(nm),
                            token(tok),
                            is_native(true),
                            native_impl(impl) {}
};

class Environment : public std::enable_shared_from_this<Environment> {
   public:
    Environment(EnvPtr parent = nullptr) : parent(parent) {
    }

    struct Variable {
        Value value;
        bool is_constant = false;
    };

    // map from name -> Variable
    std::unordered_map<std::string,
        Variable>
        values;
    EnvPtr parent;

    // Bind `name` in this scope. Throws EnvError{RedeclareVariable} when this
    // scope already has it; outer bindings may be shadowed.
    Value declare(const std::string& name, const Value& value, bool is_constant);

    // Overwrite the nearest binding of `name`. Throws EnvError{VariableNotFound}
    // or EnvError{ReassignVariable} for a constant.
    Value assign(const std::string& name, const Value& value);

    // Copy of the nearest binding's value; EnvError{VariableNotFound} if none.
    Value lookup(const std::string& name) const;

    // nearest scope defining `name`, or nullptr
    Environment* resolve(const std::string& name);
    const Environment* resolve(const std::string& name) const;

    // check if name exists in this environment or any parent
    bool has(const std::string& name) const;
};

constexpr size_t DEFAULT_MAX_CALL_DEPTH = 512;
// Statement and expression evaluations active at once, across all calls.
constexpr size_t DEFAULT_MAX_EVAL_DEPTH = 2048;

struct EvaluatorOptions {
    size_t max_call_depth = DEFAULT_MAX_CALL_DEPTH;
    size_t max_eval_depth = DEFAULT_MAX_EVAL_DEPTH;
};

class Evaluator {
   public:
    Evaluator();
    explicit Evaluator(const BuiltinRegistry& registry, EvaluatorOptions options = {});
    // Releases every scope this evaluator created, closures included.
    ~Evaluator();

    Evaluator(const Evaluator&) = delete;
    Evaluator& operator=(const Evaluator&) = delete;

    // Evaluate a whole program against the global scope; returns the value of
    // the last statement (Null for an empty program).
    Value evaluate(ProgramNode* program);
    Value evaluate(ProgramNode* program, EnvPtr env);

    Value evaluate_expression(ExpressionNode* expr, EnvPtr env);
    Value evaluate_statement(StatementNode* stmt, EnvPtr env);

    EnvPtr global_environment() const { return global_env; }
    const EvaluatorOptions& options() const { return options_; }

    // Display form used by print and the REPL echo.
    static std::string value_to_string(const Value& v);
    static bool is_void(const Value& v);

   private:
    EnvPtr global_env;
    EvaluatorOptions options_;
    size_t call_depth = 0;
    size_t eval_depth = 0;

    // Call scopes still referenced after their call returned. A function
    // declared in a scope keeps that scope alive and the scope keeps the
    // function, so these are broken up by the destructor.
    std::vector<std::weak_ptr<Environment>> retained_scopes;
    size_t retained_prune_at = 64;

    // Counts one level of evaluation recursion for its lifetime.
    class DepthGuard {
       public:
        DepthGuard(Evaluator& ev, const Token& at);
        ~DepthGuard();
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

       private:
        Evaluator& evaluator;
    };

    void init_globals(const BuiltinRegistry& registry);
    void release_call_scope(EnvPtr& local);

    Value call_function(FunctionPtr fn, const std::vector<Value>& args, EnvPtr caller_env, const Token& callToken);

    Value evaluate_numeric_literal(NumericLiteralNode* node);
    Value evaluate_binary(BinaryExpressionNode* node, EnvPtr env);
    Value evaluate_assignment(AssignmentExpressionNode* node, EnvPtr env);
    Value evaluate_object(ObjectExpressionNode* node, EnvPtr env);
    Value evaluate_call(CallExpressionNode* node, EnvPtr env);
    Value evaluate_function_declaration(FunctionDeclarationNode* node, EnvPtr env);
};

// Structural equality: objects compare by contents, functions by identity.
bool values_equal(const Value& a, const Value& b);
