#include <iostream>
#include <string>

#include "print_debug.hpp"

void print_tokens(const std::vector<Token>& tokens, std::ostream& out) {
    out << "---- TOKEN DUMP (" << tokens.size() << " tokens) ----\n";
    for (size_t i = 0; i < tokens.size(); ++i) {
        const Token& tok = tokens[i];
        out << i << ": " << token_type_name(tok.type)
            << " value='" << tok.value << "'"
            << " loc=" << tok.loc.to_string()
            << " length=" << tok.loc.length << "\n";
    }
    out << "---- END TOKEN DUMP ----\n";
}
