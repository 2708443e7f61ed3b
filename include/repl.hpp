#pragma once
#include <iostream>
#include <string>

#include "cli_commands.hpp"
#include "evaluator.hpp"

enum class ReplStatus {
    Continue,
    Exit
};

// Line-driven evaluation with one persistent Evaluator. Kept free of the
// terminal so it can be driven from tests.
class ReplSession {
   public:
    ReplSession(const mica::cli::ProjectConfig& config,
        std::ostream& out = std::cout,
        std::ostream& err = std::cerr,
        bool color = false);

    // Feed one line of input (without its newline).
    ReplStatus feed_line(const std::string& line);

    // ">>> " normally, "... " while an incomplete statement is buffered.
    const char* prompt() const { return buffer.empty() ? ">>> " : "... "; }
    bool is_buffering() const { return !buffer.empty(); }

    Evaluator& evaluator() { return evaluator_; }

   private:
    mica::cli::ProjectConfig config;
    std::ostream& out;
    std::ostream& err;
    bool color;

    Evaluator evaluator_;
    std::string buffer;
    std::string pending_error;  // parse error that made the buffer incomplete

    void report(const std::string& msg);
};

void run_repl_mode(const mica::cli::ProjectConfig& config);
