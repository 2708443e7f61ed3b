#pragma once
#include <memory>
#include <string>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

constexpr size_t DEFAULT_MAX_NESTING_DEPTH = 256;

class Parser {
   public:
    Parser(const std::vector<Token>& tokens, size_t max_nesting_depth = DEFAULT_MAX_NESTING_DEPTH);
    // Throws ParseError on the first malformed construct.
    std::unique_ptr<ProgramNode> parse();

   private:
    std::vector<Token> tokens;
    size_t position = 0;

    size_t max_depth;
    size_t depth = 0;

    // Holds levels of syntactic nesting for its lifetime. Left-associative
    // loops call enter() once per iteration since each one deepens the tree.
    class NestingGuard {
       public:
        explicit NestingGuard(Parser& p) : parser(p) {}
        NestingGuard(Parser& p, const Token& at);
        ~NestingGuard();
        NestingGuard(const NestingGuard&) = delete;
        NestingGuard& operator=(const NestingGuard&) = delete;

        void enter(const Token& at);

       private:
        Parser& parser;
        size_t levels = 0;
    };

    const Token& peek() const;

    Token consume();
    bool match(TokenType t);
    Token expect(TokenType t, const std::string& errMsg);
    bool is_operator(const Token& tok, const char* ops) const;

    // expression parsing (precedence chain)
    std::unique_ptr<ExpressionNode> parse_expression();
    std::unique_ptr<ExpressionNode> parse_assignment();
    std::unique_ptr<ExpressionNode> parse_object_or_additive();
    std::unique_ptr<ExpressionNode> parse_object_expression();
    std::unique_ptr<ExpressionNode> parse_additive();
    std::unique_ptr<ExpressionNode> parse_multiplicative();
    std::unique_ptr<ExpressionNode> parse_call_member();
    std::unique_ptr<ExpressionNode> parse_call(std::unique_ptr<ExpressionNode> callee);
    std::unique_ptr<ExpressionNode> parse_member();
    std::unique_ptr<ExpressionNode> parse_primary();
    std::vector<std::unique_ptr<ExpressionNode>> parse_arguments();

    // statements
    std::unique_ptr<StatementNode> parse_statement();
    std::unique_ptr<StatementNode> parse_variable_declaration();
    std::unique_ptr<StatementNode> parse_function_declaration();
    std::unique_ptr<StatementNode> parse_comment();
    std::unique_ptr<StatementNode> parse_expression_statement();
    void expect_statement_end(const std::string& what);
};

// Lex + parse one source unit.
std::unique_ptr<ProgramNode> produce_ast(const std::string& source,
    const std::string& filename = "<repl>",
    size_t max_nesting_depth = DEFAULT_MAX_NESTING_DEPTH);
