// src/evaluator/StatementEval.cpp
#include "MicaError.hpp"
#include "evaluator.hpp"

Value Evaluator::evaluate_statement(StatementNode* stmt, EnvPtr env) {
    if (!stmt) return std::monostate{};
    DepthGuard depth(*this, stmt->token);

    if (auto vd = dynamic_cast<VariableDeclarationNode*>(stmt)) {
        Value val = std::monostate{};
        if (vd->value) val = evaluate_expression(vd->value.get(), env);
        try {
            return env->declare(vd->identifier, val, vd->is_constant);
        } catch (const EnvError& e) {
            throw EnvError(e.kind(), e.name(), vd->token.loc);
        }
    }

    if (auto fd = dynamic_cast<FunctionDeclarationNode*>(stmt)) {
        return evaluate_function_declaration(fd, env);
    }

    if (auto es = dynamic_cast<ExpressionStatementNode*>(stmt)) {
        return evaluate_expression(es->expression.get(), env);
    }

    if (dynamic_cast<CommentNode*>(stmt)) {
        return std::monostate{};
    }

    throw EvalError(EvalError::Kind::UnexpectedStatement,
        "Unexpected statement: " + stmt->to_string(),
        stmt->token.loc);
}
