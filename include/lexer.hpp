#pragma once

#include <memory>
#include <string>
#include <vector>

#include "token.hpp"

class Lexer {
   public:
    Lexer(const std::string& source, const std::string& filename = "");
    // Throws LexError on the first character that starts no token.
    std::vector<Token> tokenize();

    std::shared_ptr<const SourceManager> source_manager() const { return src_mgr; }

   private:
    const std::string src;
    const std::string filename;
    size_t i = 0;
    int line = 1;
    int col = 1;

    std::shared_ptr<const SourceManager> src_mgr;

    // helpers
    bool eof() const;
    char peek(size_t offset = 0) const;
    char peek_next() const;
    char advance();

    // Add token: optional explicit length (if -1, length is value.size()).
    void add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length = -1);

    void scan_token(std::vector<Token>& out);
    void scan_number(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index);
    void scan_identifier_or_keyword(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index);
    void scan_line_comment(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index);
    void scan_block_comment(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index);

    // Length in bytes of the well-formed UTF-8 sequence starting at the cursor
    // (0 if the bytes there are not one).
    size_t utf8_sequence_length() const;
    bool at_alpha() const;
};
