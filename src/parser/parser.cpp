// src/parser/parser.cpp
#include "parser.hpp"

#include <cstring>

#include "MicaError.hpp"
#include "lexer.hpp"

Parser::Parser(const std::vector<Token>& tokens, size_t max_nesting_depth)
    : tokens(tokens), max_depth(max_nesting_depth) {
    // the stream always ends with the sentinel, even for a hand-built vector
    if (this->tokens.empty() || this->tokens.back().type != TokenType::EOF_TOKEN) {
        TokenLocation loc = this->tokens.empty() ? TokenLocation("<eof>", 0, 0, 0) : this->tokens.back().loc;
        this->tokens.emplace_back(TokenType::EOF_TOKEN, "", loc);
    }
}

Parser::NestingGuard::NestingGuard(Parser& p, const Token& at) : parser(p) {
    enter(at);
}

Parser::NestingGuard::~NestingGuard() {
    parser.depth -= levels;
}

void Parser::NestingGuard::enter(const Token& at) {
    if (parser.depth >= parser.max_depth) {
        throw ParseError(ParseError::Kind::NestingTooDeep,
            "Nesting is deeper than the limit of " + std::to_string(parser.max_depth),
            at.loc);
    }
    ++parser.depth;
    ++levels;
}

// Current token; the EOF sentinel once the stream is exhausted
const Token& Parser::peek() const {
    if (position < tokens.size()) return tokens[position];
    return tokens.back();
}

// Consume and return the next token. The sentinel is never consumed past.
Token Parser::consume() {
    Token t = peek();
    if (t.type != TokenType::EOF_TOKEN) position++;
    return t;
}

bool Parser::match(TokenType t) {
    if (peek().type == t) {
        consume();
        return true;
    }
    return false;
}

Token Parser::expect(TokenType t, const std::string& errMsg) {
    const Token& tok = peek();
    if (tok.type != t) {
        if (tok.type == TokenType::EOF_TOKEN) {
            throw ParseError(ParseError::Kind::UnexpectedEndOfInput,
                errMsg + " but reached end of input",
                tok.loc);
        }
        throw ParseError(t, tok.type, errMsg, tok.loc);
    }
    return consume();
}

bool Parser::is_operator(const Token& tok, const char* ops) const {
    return tok.type == TokenType::BINARY_OPERATOR && tok.value.size() == 1 &&
        std::strchr(ops, tok.value[0]) != nullptr;
}

std::unique_ptr<ProgramNode> Parser::parse() {
    auto program = std::make_unique<ProgramNode>();
    program->token = peek();
    while (peek().type != TokenType::EOF_TOKEN) {
        program->body.push_back(parse_statement());
    }
    return program;
}

std::unique_ptr<ProgramNode> produce_ast(const std::string& source, const std::string& filename, size_t max_nesting_depth) {
    Lexer lexer(source, filename);
    std::vector<Token> tokens = lexer.tokenize();
    Parser parser(tokens, max_nesting_depth);
    return parser.parse();
}
