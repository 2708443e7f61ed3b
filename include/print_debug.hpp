#pragma once
#include <iostream>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

void print_tokens(const std::vector<Token>& tokens, std::ostream& out = std::cerr);

void print_program_debug(ProgramNode* ast, int indent = 0, std::ostream& out = std::cerr);
