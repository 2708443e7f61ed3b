#include "MicaError.hpp"
#include "parser.hpp"

// ---------- statements ----------
std::unique_ptr<StatementNode> Parser::parse_statement() {
    switch (peek().type) {
        case TokenType::LET:
        case TokenType::CONST: {
            auto decl = parse_variable_declaration();
            expect_statement_end("variable declaration");
            return decl;
        }
        case TokenType::FN: {
            auto fn = parse_function_declaration();
            match(TokenType::SEMICOLON);  // optional after a body
            return fn;
        }
        case TokenType::COMMENT:
            return parse_comment();
        default:
            return parse_expression_statement();
    }
}

// A statement ends with ';'. It may be left out right before '}' or the end
// of input, so `fn f() { x }` and a bare REPL expression both parse.
void Parser::expect_statement_end(const std::string& what) {
    if (match(TokenType::SEMICOLON)) return;
    const Token& t = peek();
    if (t.type == TokenType::CLOSEBRACE || t.type == TokenType::EOF_TOKEN) return;
    throw ParseError(TokenType::SEMICOLON, t.type, "Expected ';' after " + what, t.loc);
}

std::unique_ptr<StatementNode> Parser::parse_comment() {
    Token tok = consume();
    auto node = std::make_unique<CommentNode>();
    node->token = tok;
    node->text = tok.value;
    return node;
}

std::unique_ptr<StatementNode> Parser::parse_expression_statement() {
    Token start = peek();
    auto node = std::make_unique<ExpressionStatementNode>();
    node->token = start;
    node->expression = parse_expression();
    expect_statement_end("expression");
    return node;
}

// let name; | let name = expr; | const name = expr;
std::unique_ptr<StatementNode> Parser::parse_variable_declaration() {
    Token kwTok = consume();
    bool is_constant = kwTok.type == TokenType::CONST;

    Token idTok = expect(TokenType::IDENTIFIER, "Expected identifier name after let or const keyword");

    auto node = std::make_unique<VariableDeclarationNode>();
    node->token = kwTok;
    node->identifier = idTok.value;
    node->is_constant = is_constant;

    if (peek().type == TokenType::SEMICOLON) {
        if (is_constant) {
            throw ParseError(ParseError::Kind::ConstValueRequired,
                "A value is required for const assignment",
                idTok.loc);
        }
        return node;
    }

    expect(TokenType::ASSIGN, "Expected '=' after identifier in declaration");
    node->value = parse_expression();
    return node;
}

// fn name(a, b) { body }
std::unique_ptr<StatementNode> Parser::parse_function_declaration() {
    Token fnTok = consume();
    Token nameTok = expect(TokenType::IDENTIFIER, "Expected function name following fn keyword");

    auto funcNode = std::make_unique<FunctionDeclarationNode>();
    funcNode->token = fnTok;
    funcNode->name = nameTok.value;

    // parameters go through the argument grammar and must reduce to names
    for (auto& arg : parse_arguments()) {
        auto ident = dynamic_cast<IdentifierNode*>(arg.get());
        if (!ident) {
            throw ParseError(ParseError::Kind::ParameterNotIdentifier,
                "Expected function parameter to be an identifier, got '" + arg->to_string() + "'",
                arg->token.loc);
        }
        funcNode->parameters.push_back(ident->name);
    }

    expect(TokenType::OPENBRACE, "Expected function body following declaration");
    {
        NestingGuard guard(*this, fnTok);
        while (peek().type != TokenType::CLOSEBRACE && peek().type != TokenType::EOF_TOKEN) {
            funcNode->body.push_back(parse_statement());
        }
    }
    expect(TokenType::CLOSEBRACE, "Expected '}' to close function body");

    return funcNode;
}
