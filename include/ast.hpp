#pragma once
#include <memory>
#include <string>
#include <vector>

#include "token.hpp"

// Base class for all AST nodes
struct Node {
    virtual ~Node() = default;
    Token token;  // filename, line, column for this node (set by the parser)

    // Source-like rendering; used by the AST dump and by tests.
    virtual std::string to_string() const {
        return "<node>";
    }
};

// Expressions
struct ExpressionNode : public Node {
    // Deep copy. Function values keep a clone of their declaration so they
    // outlive the Program they were parsed from.
    virtual std::unique_ptr<ExpressionNode> clone() const = 0;
};

// Numeric value kept as source text; the evaluator parses it when the literal
// is evaluated.
struct NumericLiteralNode : public ExpressionNode {
    std::string text;
    std::string to_string() const override {
        return text;
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<NumericLiteralNode>();
        n->text = text;
        n->token = token;
        return n;
    }
};

struct IdentifierNode : public ExpressionNode {
    std::string name;
    std::string to_string() const override {
        return name;
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<IdentifierNode>();
        n->name = name;
        n->token = token;
        return n;
    }
};

struct BinaryExpressionNode : public ExpressionNode {
    std::string op;  // "+", "-", "*", "/", "%"
    std::unique_ptr<ExpressionNode> left;
    std::unique_ptr<ExpressionNode> right;
    std::string to_string() const override {
        std::string l = left ? left->to_string() : "<null>";
        std::string r = right ? right->to_string() : "<null>";
        return "(" + l + " " + op + " " + r + ")";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<BinaryExpressionNode>();
        n->op = op;
        n->token = token;
        if (left) n->left = left->clone();
        if (right) n->right = right->clone();
        return n;
    }
};

// target = value (right-associative)
struct AssignmentExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> target;
    std::unique_ptr<ExpressionNode> value;
    std::string to_string() const override {
        std::string t = target ? target->to_string() : "<null>";
        std::string v = value ? value->to_string() : "<null>";
        return "(" + t + " = " + v + ")";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<AssignmentExpressionNode>();
        n->token = token;
        if (target) n->target = target->clone();
        if (value) n->value = value->clone();
        return n;
    }
};

struct CallExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> callee;
    std::vector<std::unique_ptr<ExpressionNode>> arguments;

    std::string to_string() const override {
        std::string c = callee ? callee->to_string() : "<null>";
        std::string args;
        for (size_t i = 0; i < arguments.size(); ++i) {
            if (i) args += ", ";
            args += arguments[i] ? arguments[i]->to_string() : "<null>";
        }
        return c + "(" + args + ")";
    }

    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<CallExpressionNode>();
        n->token = token;
        if (callee) n->callee = callee->clone();
        n->arguments.reserve(arguments.size());
        for (const auto& a : arguments) n->arguments.push_back(a ? a->clone() : nullptr);
        return n;
    }
};

// Member expression: obj.prop or obj[expr]. Parsed, but not evaluable.
struct MemberExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> object;
    std::unique_ptr<ExpressionNode> property;
    bool computed = false;  // true for obj[expr]

    std::string to_string() const override {
        std::string o = object ? object->to_string() : "<null>";
        std::string p = property ? property->to_string() : "<null>";
        return computed ? o + "[" + p + "]" : o + "." + p;
    }

    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<MemberExpressionNode>();
        n->token = token;
        n->computed = computed;
        if (object) n->object = object->clone();
        if (property) n->property = property->clone();
        return n;
    }
};

// One `key` or `key: value` entry of an object literal. A null value marks
// shorthand, resolved by looking the key up as a variable.
struct PropertyNode {
    std::string key;
    std::unique_ptr<ExpressionNode> value;
    Token token;

    std::string to_string() const {
        return value ? key + ": " + value->to_string() : key;
    }
    std::unique_ptr<PropertyNode> clone() const {
        auto n = std::make_unique<PropertyNode>();
        n->key = key;
        n->token = token;
        if (value) n->value = value->clone();
        return n;
    }
};

struct ObjectExpressionNode : public ExpressionNode {
    std::vector<std::unique_ptr<PropertyNode>> properties;

    std::string to_string() const override {
        if (properties.empty()) return "{}";
        std::string s = "{ ";
        for (size_t i = 0; i < properties.size(); ++i) {
            if (i) s += ", ";
            s += properties[i] ? properties[i]->to_string() : "<null>";
        }
        s += " }";
        return s;
    }

    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<ObjectExpressionNode>();
        n->token = token;
        n->properties.reserve(properties.size());
        for (const auto& p : properties) n->properties.push_back(p ? p->clone() : nullptr);
        return n;
    }
};

// Statements
struct StatementNode : public Node {
    virtual std::unique_ptr<StatementNode> clone() const = 0;
};

struct VariableDeclarationNode : public StatementNode {
    std::string identifier;
    std::unique_ptr<ExpressionNode> value;  // null when declared without initializer
    bool is_constant = false;

    std::string to_string() const override {
        std::string s = (is_constant ? "const " : "let ") + identifier;
        if (value) s += " = " + value->to_string();
        return s + ";";
    }
    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<VariableDeclarationNode>();
        n->token = token;
        n->identifier = identifier;
        n->is_constant = is_constant;
        n->value = value ? value->clone() : nullptr;
        return n;
    }
};

struct ExpressionStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> expression;

    std::string to_string() const override {
        return (expression ? expression->to_string() : "<null>") + ";";
    }
    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<ExpressionStatementNode>();
        n->token = token;
        n->expression = expression ? expression->clone() : nullptr;
        return n;
    }
};

struct CommentNode : public StatementNode {
    std::string text;

    std::string to_string() const override {
        return "/*" + text + "*/";
    }
    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<CommentNode>();
        n->token = token;
        n->text = text;
        return n;
    }
};

struct FunctionDeclarationNode : public StatementNode {
    std::string name;
    std::vector<std::string> parameters;
    std::vector<std::unique_ptr<StatementNode>> body;  // function body statements
    bool is_constant = false;                          // parsed declarations are never marked const

    std::string to_string() const override {
        std::string s = "fn " + name + "(";
        for (size_t i = 0; i < parameters.size(); ++i) {
            if (i) s += ", ";
            s += parameters[i];
        }
        s += ") {";
        for (const auto& st : body) s += " " + (st ? st->to_string() : "<null>");
        return s + " }";
    }
    std::unique_ptr<StatementNode> clone() const override {
        return clone_declaration();
    }
    std::unique_ptr<FunctionDeclarationNode> clone_declaration() const {
        auto n = std::make_unique<FunctionDeclarationNode>();
        n->token = token;
        n->name = name;
        n->parameters = parameters;
        n->is_constant = is_constant;
        n->body.reserve(body.size());
        for (const auto& s : body) n->body.push_back(s ? s->clone() : nullptr);
        return n;
    }
};

struct ProgramNode : public Node {
    std::vector<std::unique_ptr<StatementNode>> body;

    std::string to_string() const override {
        std::string s;
        for (size_t i = 0; i < body.size(); ++i) {
            if (i) s += "\n";
            s += body[i] ? body[i]->to_string() : "<null>";
        }
        return s;
    }
};
