// src/evaluator/ExpressionEval.cpp
#include <charconv>
#include <limits>

#include "MicaError.hpp"
#include "evaluator.hpp"

namespace {

constexpr std::int64_t INT_MAX64 = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t INT_MIN64 = std::numeric_limits<std::int64_t>::min();

bool add_overflows(std::int64_t a, std::int64_t b) {
    return (b > 0 && a > INT_MAX64 - b) || (b < 0 && a < INT_MIN64 - b);
}

bool sub_overflows(std::int64_t a, std::int64_t b) {
    return (b < 0 && a > INT_MAX64 + b) || (b > 0 && a < INT_MIN64 + b);
}

bool mul_overflows(std::int64_t a, std::int64_t b) {
    if (a == 0 || b == 0) return false;
    if (a == -1) return b == INT_MIN64;
    if (b == -1) return a == INT_MIN64;
    if (a > 0) {
        return b > 0 ? a > INT_MAX64 / b : b < INT_MIN64 / a;
    }
    return b > 0 ? a < INT_MIN64 / b : a < INT_MAX64 / b;
}

}  // namespace

Value Evaluator::evaluate_expression(ExpressionNode* expr, EnvPtr env) {
    if (!expr) return std::monostate{};
    DepthGuard depth(*this, expr->token);

    if (auto n = dynamic_cast<NumericLiteralNode*>(expr)) {
        return evaluate_numeric_literal(n);
    }

    if (auto id = dynamic_cast<IdentifierNode*>(expr)) {
        try {
            return env->lookup(id->name);
        } catch (const EnvError& e) {
            throw EnvError(e.kind(), e.name(), id->token.loc);
        }
    }

    if (auto b = dynamic_cast<BinaryExpressionNode*>(expr)) {
        return evaluate_binary(b, env);
    }

    if (auto a = dynamic_cast<AssignmentExpressionNode*>(expr)) {
        return evaluate_assignment(a, env);
    }

    if (auto o = dynamic_cast<ObjectExpressionNode*>(expr)) {
        return evaluate_object(o, env);
    }

    if (auto c = dynamic_cast<CallExpressionNode*>(expr)) {
        return evaluate_call(c, env);
    }

    // member access is parsed but has no evaluation rule
    throw EvalError(EvalError::Kind::UnexpectedStatement,
        "Unexpected statement: " + expr->to_string(),
        expr->token.loc);
}

Value Evaluator::evaluate_numeric_literal(NumericLiteralNode* node) {
    std::int64_t out = 0;
    const char* first = node->text.data();
    const char* last = first + node->text.size();
    auto res = std::from_chars(first, last, out);
    if (res.ec == std::errc::result_out_of_range) {
        throw EvalError(EvalError::Kind::NumberOutOfRange,
            "Number literal '" + node->text + "' does not fit in a 64-bit integer",
            node->token.loc);
    }
    if (res.ec != std::errc() || res.ptr != last) {
        throw EvalError(EvalError::Kind::NumberOutOfRange,
            "Malformed number literal '" + node->text + "'",
            node->token.loc);
    }
    return out;
}

Value Evaluator::evaluate_binary(BinaryExpressionNode* node, EnvPtr env) {
    Value left = evaluate_expression(node->left.get(), env);
    Value right = evaluate_expression(node->right.get(), env);

    // Non-numeric operands produce null.
    if (!std::holds_alternative<std::int64_t>(left) || !std::holds_alternative<std::int64_t>(right)) {
        return std::monostate{};
    }

    std::int64_t l = std::get<std::int64_t>(left);
    std::int64_t r = std::get<std::int64_t>(right);
    const std::string& op = node->op;

    auto overflow = [&]() {
        return EvalError(EvalError::Kind::IntegerOverflow,
            "Integer overflow in " + std::to_string(l) + " " + op + " " + std::to_string(r),
            node->token.loc);
    };

    if (op == "+") {
        if (add_overflows(l, r)) throw overflow();
        return l + r;
    }
    if (op == "-") {
        if (sub_overflows(l, r)) throw overflow();
        return l - r;
    }
    if (op == "*") {
        if (mul_overflows(l, r)) throw overflow();
        return l * r;
    }
    if (op == "/" || op == "%") {
        if (r == 0) {
            throw EvalError(EvalError::Kind::DivisionByZero,
                std::string(op == "/" ? "Division" : "Modulo") + " by zero",
                node->token.loc);
        }
        if (l == INT_MIN64 && r == -1) {
            if (op == "/") throw overflow();
            return std::int64_t{0};
        }
        return op == "/" ? l / r : l % r;
    }

    throw EvalError(EvalError::Kind::InvalidOperator,
        "Invalid operator '" + op + "'",
        node->token.loc);
}

Value Evaluator::evaluate_assignment(AssignmentExpressionNode* node, EnvPtr env) {
    auto target = dynamic_cast<IdentifierNode*>(node->target.get());
    if (!target) {
        throw EvalError(EvalError::Kind::InvalidAssignment,
            "Invalid assignment target '" + (node->target ? node->target->to_string() : std::string("<null>")) + "'",
            node->token.loc);
    }

    Value val = evaluate_expression(node->value.get(), env);
    try {
        return env->assign(target->name, val);
    } catch (const EnvError& e) {
        throw EnvError(e.kind(), e.name(), target->token.loc);
    }
}

Value Evaluator::evaluate_object(ObjectExpressionNode* node, EnvPtr env) {
    auto obj = std::make_shared<ObjectValue>();
    for (const auto& prop : node->properties) {
        if (!prop) continue;
        Value v;
        if (prop->value) {
            v = evaluate_expression(prop->value.get(), env);
        } else {
            // shorthand { foo } reads the variable foo
            try {
                v = env->lookup(prop->key);
            } catch (const EnvError& e) {
                throw EnvError(e.kind(), e.name(), prop->token.loc);
            }
        }
        obj->properties[prop->key] = v;
    }
    return obj;
}
