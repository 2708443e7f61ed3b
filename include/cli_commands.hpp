#ifndef MICA_CLI_COMMANDS_HPP
#define MICA_CLI_COMMANDS_HPP

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "evaluator.hpp"
#include "parser.hpp"

namespace mica {
namespace cli {

// Structure to hold parsed mica.json data
struct ProjectConfig {
    std::string name;
    std::string version;
    std::string entry;

    struct Limits {
        size_t max_call_depth = DEFAULT_MAX_CALL_DEPTH;
        size_t max_nesting_depth = DEFAULT_MAX_NESTING_DEPTH;
    };
    Limits limits;

    struct Repl {
        bool history = true;
        bool echo_ast = false;
    };
    Repl repl;

    std::string root;  // directory that holds mica.json; empty when none was found
    bool is_valid = false;
};

// Command result structure
struct CommandResult {
    int exit_code;
    std::string message;
};

// Debug dumps requested on the command line
struct DumpOptions {
    bool tokens = false;
    bool ast = false;
};

// Main command dispatcher ("run" is the only command)
CommandResult execute_command(const std::vector<std::string>& args, const ProjectConfig& config, const DumpOptions& dumps = {});
CommandResult cmd_run(const std::vector<std::string>& args, const ProjectConfig& config, const DumpOptions& dumps = {});

// Helper functions
std::optional<ProjectConfig> find_and_parse_mica_json(const std::string& start_dir = ".");
std::optional<ProjectConfig> parse_mica_json(const std::string& filepath);
std::string get_project_root(const std::string& start_dir = ".");

// Lex, parse and evaluate `source`. Errors go to `err`; returns the exit status.
int run_source(const std::string& source,
    const std::string& filename,
    const ProjectConfig& config,
    const DumpOptions& dumps,
    std::ostream& out,
    std::ostream& err);

int run_file(const std::string& filepath, const ProjectConfig& config, const DumpOptions& dumps = {});

}  // namespace cli
}  // namespace mica

#endif  // MICA_CLI_COMMANDS_HPP
