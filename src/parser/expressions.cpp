#include "MicaError.hpp"
#include "parser.hpp"

// ---------- expressions (precedence) ----------
std::unique_ptr<ExpressionNode> Parser::parse_expression() {
    return parse_assignment();
}

// Right-associative: a = b = c
std::unique_ptr<ExpressionNode> Parser::parse_assignment() {
    auto left = parse_object_or_additive();

    if (peek().type != TokenType::ASSIGN) {
        return left;
    }

    Token eqTok = consume();
    NestingGuard guard(*this, eqTok);

    auto node = std::make_unique<AssignmentExpressionNode>();
    node->token = eqTok;
    node->target = std::move(left);
    node->value = parse_assignment();
    return node;
}

std::unique_ptr<ExpressionNode> Parser::parse_object_or_additive() {
    if (peek().type == TokenType::OPENBRACE) {
        return parse_object_expression();
    }
    return parse_additive();
}

// { key: value, shorthand, }
std::unique_ptr<ExpressionNode> Parser::parse_object_expression() {
    Token openTok = consume();
    NestingGuard guard(*this, openTok);

    auto node = std::make_unique<ObjectExpressionNode>();
    node->token = openTok;

    while (peek().type != TokenType::CLOSEBRACE && peek().type != TokenType::EOF_TOKEN) {
        Token keyTok = expect(TokenType::IDENTIFIER, "Object literal identifier expected");

        auto prop = std::make_unique<PropertyNode>();
        prop->token = keyTok;
        prop->key = keyTok.value;

        if (match(TokenType::COMMA) || peek().type == TokenType::CLOSEBRACE) {
            node->properties.push_back(std::move(prop));
            continue;
        }

        expect(TokenType::COLON, "Missing colon after identifier in object expression");
        prop->value = parse_expression();
        node->properties.push_back(std::move(prop));

        if (peek().type != TokenType::CLOSEBRACE) {
            expect(TokenType::COMMA, "Expected comma or closing brace after property");
        }
    }

    expect(TokenType::CLOSEBRACE, "Object literal is missing a closing brace");
    return node;
}

std::unique_ptr<ExpressionNode> Parser::parse_additive() {
    auto left = parse_multiplicative();
    NestingGuard chain(*this);
    while (is_operator(peek(), "+-")) {
        Token op = consume();
        chain.enter(op);
        auto right = parse_multiplicative();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->op = op.value;
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = op;
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_multiplicative() {
    auto left = parse_call_member();
    NestingGuard chain(*this);
    while (is_operator(peek(), "*/%")) {
        Token op = consume();
        chain.enter(op);
        auto right = parse_call_member();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->op = op.value;
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = op;
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_call_member() {
    auto member = parse_member();
    if (peek().type == TokenType::OPENPARENTHESIS) {
        return parse_call(std::move(member));
    }
    return member;
}

// callee(args)(args)...
std::unique_ptr<ExpressionNode> Parser::parse_call(std::unique_ptr<ExpressionNode> callee) {
    NestingGuard chain(*this);
    while (peek().type == TokenType::OPENPARENTHESIS) {
        chain.enter(peek());
        auto node = std::make_unique<CallExpressionNode>();
        node->token = peek();
        node->callee = std::move(callee);
        node->arguments = parse_arguments();
        callee = std::move(node);
    }
    return callee;
}

// ( expr, expr, ... )
std::vector<std::unique_ptr<ExpressionNode>> Parser::parse_arguments() {
    Token openTok = expect(TokenType::OPENPARENTHESIS, "Expected open parenthesis");
    NestingGuard guard(*this, openTok);

    std::vector<std::unique_ptr<ExpressionNode>> args;
    if (match(TokenType::CLOSEPARENTHESIS)) {
        return args;
    }

    args.push_back(parse_assignment());
    while (match(TokenType::COMMA)) {
        args.push_back(parse_assignment());
    }

    expect(TokenType::CLOSEPARENTHESIS, "Missing closing parenthesis in argument list");
    return args;
}

// primary ( '.' identifier | '[' expr ']' )*
std::unique_ptr<ExpressionNode> Parser::parse_member() {
    auto object = parse_primary();

    NestingGuard chain(*this);
    while (peek().type == TokenType::DOT || peek().type == TokenType::OPENBRACKET) {
        Token opTok = consume();
        chain.enter(opTok);

        auto node = std::make_unique<MemberExpressionNode>();
        node->token = opTok;

        if (opTok.type == TokenType::DOT) {
            const Token& next = peek();
            if (next.type == TokenType::EOF_TOKEN) {
                throw ParseError(ParseError::Kind::UnexpectedEndOfInput,
                    "Expected identifier after '.' but reached end of input",
                    next.loc);
            }
            if (next.type != TokenType::IDENTIFIER) {
                throw ParseError(ParseError::Kind::DotWithoutIdentifier,
                    "No dot operator without an identifier on its right-hand side",
                    next.loc);
            }
            node->property = parse_primary();
            node->computed = false;
        } else {
            node->property = parse_expression();
            node->computed = true;
            expect(TokenType::CLOSEBRACKET, "Missing closing bracket in computed member expression");
        }

        node->object = std::move(object);
        object = std::move(node);
    }

    return object;
}

std::unique_ptr<ExpressionNode> Parser::parse_primary() {
    Token t = peek();

    if (t.type == TokenType::IDENTIFIER) {
        consume();
        auto node = std::make_unique<IdentifierNode>();
        node->name = t.value;
        node->token = t;
        return node;
    }

    if (t.type == TokenType::NUMBER) {
        consume();
        auto node = std::make_unique<NumericLiteralNode>();
        node->text = t.value;
        node->token = t;
        return node;
    }

    if (t.type == TokenType::OPENPARENTHESIS) {
        consume();
        NestingGuard guard(*this, t);
        auto expr = parse_expression();
        expect(TokenType::CLOSEPARENTHESIS, "No right paren inside expression");
        return expr;
    }

    if (t.type == TokenType::EOF_TOKEN) {
        throw ParseError(ParseError::Kind::UnexpectedEndOfInput,
            "Expected an expression but reached end of input",
            t.loc);
    }

    throw ParseError(ParseError::Kind::UnsupportedTokenType,
        std::string("Unsupported token ") + token_type_name(t.type) + " '" + t.value + "' in expression",
        t.loc);
}
