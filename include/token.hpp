#pragma once

#include <algorithm>
#include <memory>
#include <string>
#include <utility>

#include "SourceManager.hpp"

// Token types (keep in sync with the lexer keyword table and token_type_name)
enum class TokenType {
    // -----------------------
    // Declarations
    // -----------------------
    LET,
    CONST,
    FN,

    // -----------------------
    // Reserved, not used by the grammar yet
    // -----------------------
    STRUCT,
    ENUM,
    RETURN,
    IF,
    ELSE,

    // -----------------------
    // Literals & identifiers
    // -----------------------
    IDENTIFIER,
    NUMBER,

    // -----------------------
    // Operators
    // -----------------------
    BINARY_OPERATOR,  // + - * / %
    ASSIGN,           // =

    // -----------------------
    // Punctuation
    // -----------------------
    OPENPARENTHESIS,
    CLOSEPARENTHESIS,
    OPENBRACE,
    CLOSEBRACE,
    OPENBRACKET,
    CLOSEBRACKET,
    COLON,
    SEMICOLON,
    COMMA,
    DOT,

    // -----------------------
    // Miscellaneous
    // -----------------------
    COMMENT,
    EOF_TOKEN
};

// Human readable name, used in diagnostics and token dumps.
inline const char* token_type_name(TokenType t) {
    switch (t) {
        case TokenType::LET: return "LET";
        case TokenType::CONST: return "CONST";
        case TokenType::FN: return "FN";
        case TokenType::STRUCT: return "STRUCT";
        case TokenType::ENUM: return "ENUM";
        case TokenType::RETURN: return "RETURN";
        case TokenType::IF: return "IF";
        case TokenType::ELSE: return "ELSE";
        case TokenType::IDENTIFIER: return "IDENTIFIER";
        case TokenType::NUMBER: return "NUMBER";
        case TokenType::BINARY_OPERATOR: return "BINARY_OPERATOR";
        case TokenType::ASSIGN: return "ASSIGN";
        case TokenType::OPENPARENTHESIS: return "OPENPARENTHESIS";
        case TokenType::CLOSEPARENTHESIS: return "CLOSEPARENTHESIS";
        case TokenType::OPENBRACE: return "OPENBRACE";
        case TokenType::CLOSEBRACE: return "CLOSEBRACE";
        case TokenType::OPENBRACKET: return "OPENBRACKET";
        case TokenType::CLOSEBRACKET: return "CLOSEBRACKET";
        case TokenType::COLON: return "COLON";
        case TokenType::SEMICOLON: return "SEMICOLON";
        case TokenType::COMMA: return "COMMA";
        case TokenType::DOT: return "DOT";
        case TokenType::COMMENT: return "COMMENT";
        case TokenType::EOF_TOKEN: return "EOF_TOKEN";
    }
    return "TOKEN(?)";
}

// Small struct for token location / span in source
struct TokenLocation {
   public:
    std::string filename;  // source filename (or "<repl>")
    int line = 1;          // 1-based; 0 means "no location"
    int col = 1;           // 1-based column of token start
    int length = 0;        // token length in characters

    std::shared_ptr<const SourceManager> src_mgr;

    TokenLocation() = default;
    TokenLocation(const std::string& fn, int ln, int c, int len = 0, std::shared_ptr<const SourceManager> mgr = nullptr)
        : filename(fn), line(ln), col(c), length(len), src_mgr(std::move(mgr)) {}

    int end_col() const { return col + std::max(0, length - 1); }

    bool known() const { return line > 0; }

    std::string to_string() const {
        return filename + ":" + std::to_string(line) + ":" + std::to_string(col);
    }
    std::string get_line_trace() const;
};

// Represents a single token with location
struct Token {
    TokenType type = TokenType::EOF_TOKEN;
    std::string value;  // raw text (comment text without its delimiters)
    TokenLocation loc;  // file:line:col and length/span

    Token() = default;
    Token(TokenType t, const std::string& v, const TokenLocation& l)
        : type(t), value(v), loc(l) {}

    const std::string& filename() const { return loc.filename; }
    int line() const { return loc.line; }
    int col() const { return loc.col; }
    int length() const { return loc.length; }

    std::string debug_string() const {
        return loc.to_string() + " [" + value + "]";
    }
};

inline std::string TokenLocation::get_line_trace() const {
    if (!src_mgr) {
        return "(source context unavailable)";
    }
    return src_mgr->format_error_context(line, col);
}
