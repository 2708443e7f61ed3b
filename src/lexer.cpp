#include "lexer.hpp"

#include <cctype>
#include <cstdio>
#include <unordered_map>

#include "MicaError.hpp"

// Constructor
Lexer::Lexer(const std::string& source, const std::string& filename)
    : src(source),
      filename(filename),
      i(0),
      line(1),
      col(1),
      src_mgr(std::make_shared<SourceManager>(filename.empty() ? "<repl>" : filename, source)) {}

bool Lexer::eof() const {
    return i >= src.size();
}
char Lexer::peek(size_t offset) const {
    size_t idx = i + offset;
    if (idx >= src.size()) return '\0';
    return src[idx];
}
char Lexer::peek_next() const {
    return peek(1);
}

char Lexer::advance() {
    if (eof()) return '\0';
    char c = src[i++];
    if (c == '\n') {
        line++;
        col = 1;
    } else if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
        // continuation bytes of a UTF-8 sequence share the column of their lead byte
        col++;
    }
    return c;
}

void Lexer::add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length) {
    int len = tok_length >= 0 ? tok_length : static_cast<int>(value.size());
    TokenLocation loc(filename.empty() ? "<repl>" : filename, tok_line, tok_col, len, src_mgr);
    out.emplace_back(type, value, loc);
}

size_t Lexer::utf8_sequence_length() const {
    unsigned char lead = static_cast<unsigned char>(peek());
    size_t len = 0;
    unsigned char lo = 0x80, hi = 0xBF;  // allowed range of the second byte

    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) lo = 0xA0;  // overlong
        if (lead == 0xED) hi = 0x9F;  // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) lo = 0x90;
        if (lead == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }

    for (size_t k = 1; k < len; ++k) {
        if (i + k >= src.size()) return 0;
        unsigned char b = static_cast<unsigned char>(src[i + k]);
        if (k == 1 ? (b < lo || b > hi) : (b < 0x80 || b > 0xBF)) return 0;
    }
    return len;
}

// Alphabetic in the Unicode-aware sense used for identifiers: an ASCII letter,
// or any well-formed multi-byte UTF-8 character.
bool Lexer::at_alpha() const {
    unsigned char c = static_cast<unsigned char>(peek());
    if (c < 0x80) return std::isalpha(c) != 0;
    return utf8_sequence_length() > 0;
}

void Lexer::scan_number(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    std::string val;
    while (!eof() && std::isdigit(static_cast<unsigned char>(peek()))) {
        val.push_back(advance());
    }

    int tok_length = static_cast<int>(i - start_index);
    add_token(out, TokenType::NUMBER, val, tok_line, tok_col, tok_length);
}

void Lexer::scan_identifier_or_keyword(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    std::string id;
    while (!eof()) {
        if (peek() == '_') {
            id.push_back(advance());
            continue;
        }
        if (!at_alpha()) break;
        size_t n = static_cast<unsigned char>(peek()) < 0x80 ? 1 : utf8_sequence_length();
        for (size_t k = 0; k < n; ++k) id.push_back(advance());
    }

    static const std::unordered_map<std::string, TokenType> keywords = {
        {"let", TokenType::LET},
        {"const", TokenType::CONST},
        {"fn", TokenType::FN},

        // reserved
        {"struct", TokenType::STRUCT},
        {"enum", TokenType::ENUM},
        {"return", TokenType::RETURN},
        {"if", TokenType::IF},
        {"else", TokenType::ELSE},
    };

    auto it = keywords.find(id);
    int tok_length = col - tok_col;  // in characters, not bytes
    if (it != keywords.end()) {
        add_token(out, it->second, id, tok_line, tok_col, tok_length);
    } else {
        add_token(out, TokenType::IDENTIFIER, id, tok_line, tok_col, tok_length);
    }
}

// `// text` up to (not including) the end of the line.
void Lexer::scan_line_comment(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    advance();
    advance();
    std::string text;
    while (!eof() && peek() != '\n') {
        text.push_back(advance());
    }
    if (!text.empty() && text.back() == '\r') text.pop_back();
    add_token(out, TokenType::COMMENT, text, tok_line, tok_col, static_cast<int>(i - start_index));
}

// `/* text */`, not nested. An unterminated comment runs to the end of input.
void Lexer::scan_block_comment(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    advance();
    advance();
    std::string text;
    while (!eof()) {
        if (peek() == '*' && peek_next() == '/') {
            advance();
            advance();
            break;
        }
        text.push_back(advance());
    }
    add_token(out, TokenType::COMMENT, text, tok_line, tok_col, static_cast<int>(i - start_index));
}

void Lexer::scan_token(std::vector<Token>& out) {
    char c = peek();
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
        advance();
        return;
    }

    int tok_line = line;
    int tok_col = col;
    size_t start_index = i;

    if (c == '/') {
        if (peek_next() == '/') {
            scan_line_comment(out, tok_line, tok_col, start_index);
            return;
        }
        if (peek_next() == '*') {
            scan_block_comment(out, tok_line, tok_col, start_index);
            return;
        }
    }

    static const std::unordered_map<char, TokenType> single_char = {
        {'(', TokenType::OPENPARENTHESIS},
        {')', TokenType::CLOSEPARENTHESIS},
        {'{', TokenType::OPENBRACE},
        {'}', TokenType::CLOSEBRACE},
        {'[', TokenType::OPENBRACKET},
        {']', TokenType::CLOSEBRACKET},
        {':', TokenType::COLON},
        {';', TokenType::SEMICOLON},
        {',', TokenType::COMMA},
        {'=', TokenType::ASSIGN},
        {'.', TokenType::DOT},
        {'+', TokenType::BINARY_OPERATOR},
        {'-', TokenType::BINARY_OPERATOR},
        {'*', TokenType::BINARY_OPERATOR},
        {'/', TokenType::BINARY_OPERATOR},
        {'%', TokenType::BINARY_OPERATOR},
    };

    auto it = single_char.find(c);
    if (it != single_char.end()) {
        add_token(out, it->second, std::string(1, c), tok_line, tok_col, 1);
        advance();
        return;
    }

    if (std::isdigit(static_cast<unsigned char>(c))) {
        scan_number(out, tok_line, tok_col, start_index);
        return;
    }

    if (at_alpha()) {
        scan_identifier_or_keyword(out, tok_line, tok_col, start_index);
        return;
    }

    // unknown character (or a malformed UTF-8 byte, shown as \xNN)
    std::string shown;
    if (static_cast<unsigned char>(c) < 0x80 && std::isprint(static_cast<unsigned char>(c))) {
        shown = std::string(1, c);
    } else {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\x%02X", static_cast<unsigned char>(c));
        shown = buf;
    }
    TokenLocation loc(filename.empty() ? "<repl>" : filename, tok_line, tok_col, 1, src_mgr);
    throw LexError(LexError::Kind::UnexpectedCharacter, shown, loc);
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> out;

    // skip UTF-8 BOM if present
    if (src.size() >= 3 && (unsigned char)src[0] == 0xEF && (unsigned char)src[1] == 0xBB && (unsigned char)src[2] == 0xBF) {
        i = 3;
    }

    while (!eof()) scan_token(out);

    // final EOF token
    add_token(out, TokenType::EOF_TOKEN, "", line, col, 0);

    return out;
}
