#include "print_debug.hpp"

#include <iostream>
#include <string>

static void print_expression(const ExpressionNode* expr, int indent, std::ostream& out);
static void print_statement(const StatementNode* stmt, int indent, std::ostream& out);

static std::string pad(int indent) {
    return std::string(static_cast<size_t>(indent), ' ');
}

static void print_expression(const ExpressionNode* expr, int indent, std::ostream& out) {
    std::string ind = pad(indent);
    if (!expr) {
        out << ind << "<null>\n";
        return;
    }

    if (auto n = dynamic_cast<const NumericLiteralNode*>(expr)) {
        out << ind << "NumericLiteral " << n->text << "\n";
    } else if (auto id = dynamic_cast<const IdentifierNode*>(expr)) {
        out << ind << "Identifier " << id->name << "\n";
    } else if (auto b = dynamic_cast<const BinaryExpressionNode*>(expr)) {
        out << ind << "BinaryExpression '" << b->op << "'\n";
        print_expression(b->left.get(), indent + 2, out);
        print_expression(b->right.get(), indent + 2, out);
    } else if (auto a = dynamic_cast<const AssignmentExpressionNode*>(expr)) {
        out << ind << "AssignmentExpression\n";
        print_expression(a->target.get(), indent + 2, out);
        print_expression(a->value.get(), indent + 2, out);
    } else if (auto c = dynamic_cast<const CallExpressionNode*>(expr)) {
        out << ind << "CallExpression (" << c->arguments.size() << " args)\n";
        print_expression(c->callee.get(), indent + 2, out);
        for (const auto& arg : c->arguments) print_expression(arg.get(), indent + 4, out);
    } else if (auto m = dynamic_cast<const MemberExpressionNode*>(expr)) {
        out << ind << "MemberExpression" << (m->computed ? " [computed]" : "") << "\n";
        print_expression(m->object.get(), indent + 2, out);
        print_expression(m->property.get(), indent + 2, out);
    } else if (auto o = dynamic_cast<const ObjectExpressionNode*>(expr)) {
        out << ind << "ObjectExpression\n";
        for (const auto& p : o->properties) {
            if (!p) continue;
            if (p->value) {
                out << ind << "  Property " << p->key << "\n";
                print_expression(p->value.get(), indent + 4, out);
            } else {
                out << ind << "  Property " << p->key << " (shorthand)\n";
            }
        }
    } else {
        out << ind << expr->to_string() << "\n";
    }
}

static void print_statement(const StatementNode* stmt, int indent, std::ostream& out) {
    std::string ind = pad(indent);
    if (!stmt) {
        out << ind << "<null>\n";
        return;
    }

    if (auto vd = dynamic_cast<const VariableDeclarationNode*>(stmt)) {
        out << ind << "VariableDeclaration " << (vd->is_constant ? "const " : "let ") << vd->identifier << "\n";
        if (vd->value) print_expression(vd->value.get(), indent + 2, out);
    } else if (auto fd = dynamic_cast<const FunctionDeclarationNode*>(stmt)) {
        out << ind << "FunctionDeclaration " << fd->name << "(";
        for (size_t i = 0; i < fd->parameters.size(); ++i) {
            if (i) out << ", ";
            out << fd->parameters[i];
        }
        out << ")\n";
        for (const auto& s : fd->body) print_statement(s.get(), indent + 2, out);
    } else if (auto es = dynamic_cast<const ExpressionStatementNode*>(stmt)) {
        out << ind << "ExpressionStatement\n";
        print_expression(es->expression.get(), indent + 2, out);
    } else if (auto cm = dynamic_cast<const CommentNode*>(stmt)) {
        out << ind << "Comment \"" << cm->text << "\"\n";
    } else {
        out << ind << stmt->to_string() << "\n";
    }
}

void print_program_debug(ProgramNode* ast, int indent, std::ostream& out) {
    std::string ind = pad(indent);
    if (!ast) {
        out << ind << "Program <null>\n";
        return;
    }

    out << ind << "---- AST DUMP ----\n";
    out << ind << "Program (" << ast->body.size() << " statements)\n";
    for (const auto& stmt : ast->body) {
        print_statement(stmt.get(), indent + 2, out);
    }
    out << ind << "---- END AST DUMP ----\n";
}
