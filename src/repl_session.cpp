#include <memory>

#include "MicaError.hpp"
#include "builtins.hpp"
#include "colors.hpp"
#include "parser.hpp"
#include "print_debug.hpp"
#include "repl.hpp"

static EvaluatorOptions evaluator_options(const mica::cli::ProjectConfig& config) {
    EvaluatorOptions options;
    options.max_call_depth = config.limits.max_call_depth;
    return options;
}

ReplSession::ReplSession(const mica::cli::ProjectConfig& config,
    std::ostream& out,
    std::ostream& err,
    bool color) : config(config),
                  out(out),
                  err(err),
                  color(color),
                  evaluator_(default_builtins(out), evaluator_options(config)) {
}

void ReplSession::report(const std::string& msg) {
    err << Color::paint("Error: ", Color::red, color) << msg << std::endl;
}

ReplStatus ReplSession::feed_line(const std::string& line) {
    if (line == "exit") return ReplStatus::Exit;

    if (line.empty()) {
        if (buffer.empty()) return ReplStatus::Exit;
        // a blank line gives up on the incomplete statement
        report(pending_error);
        buffer.clear();
        pending_error.clear();
        return ReplStatus::Continue;
    }

    buffer += line;
    buffer.push_back('\n');

    std::unique_ptr<ProgramNode> ast;
    try {
        ast = produce_ast(buffer, "<repl>", config.limits.max_nesting_depth);
    } catch (const ParseError& e) {
        if (e.kind() == ParseError::Kind::UnexpectedEndOfInput) {
            // incomplete -> keep buffer and continue reading
            pending_error = e.what();
            return ReplStatus::Continue;
        }
        report(e.what());
        buffer.clear();
        pending_error.clear();
        return ReplStatus::Continue;
    } catch (const MicaError& e) {
        report(e.what());
        buffer.clear();
        pending_error.clear();
        return ReplStatus::Continue;
    }

    buffer.clear();
    pending_error.clear();

    try {
        if (config.repl.echo_ast) print_program_debug(ast.get(), 0, out);
        Value v = evaluator_.evaluate(ast.get());
        if (!Evaluator::is_void(v)) {
            out << Evaluator::value_to_string(v) << "\n";
        }
    } catch (const MicaError& e) {
        report(e.what());
    }
    return ReplStatus::Continue;
}
