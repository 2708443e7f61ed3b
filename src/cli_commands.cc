#include "cli_commands.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "MicaError.hpp"
#include "builtins.hpp"
#include "colors.hpp"
#include "lexer.hpp"
#include "print_debug.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace mica {
namespace cli {

// Positive integer limit, or the default with a warning.
static size_t read_limit(const json& limits, const char* key, size_t fallback, const std::string& filepath) {
    if (!limits.contains(key)) return fallback;
    const json& v = limits[key];
    if (!v.is_number_unsigned() || v.get<size_t>() == 0) {
        std::cerr << "Warning: " << filepath << ": limits." << key
                  << " must be a positive integer, using " << fallback << std::endl;
        return fallback;
    }
    return v.get<size_t>();
}

// Parse mica.json with nlohmann/json
std::optional<ProjectConfig> parse_mica_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            std::cerr << "JSON error in " << filepath << ": top level must be an object" << std::endl;
            return std::nullopt;
        }

        ProjectConfig config;
        config.is_valid = true;

        // Extract basic fields with defaults
        config.name = j.value("name", "");
        config.version = j.value("version", "");
        config.entry = j.value("entry", "");

        if (j.contains("limits") && j["limits"].is_object()) {
            const json& limits = j["limits"];
            config.limits.max_call_depth = read_limit(limits, "max_call_depth", config.limits.max_call_depth, filepath);
            config.limits.max_nesting_depth = read_limit(limits, "max_nesting_depth", config.limits.max_nesting_depth, filepath);
        }

        if (j.contains("repl") && j["repl"].is_object()) {
            config.repl.history = j["repl"].value("history", config.repl.history);
            config.repl.echo_ast = j["repl"].value("echo_ast", config.repl.echo_ast);
        }

        config.root = fs::absolute(filepath).parent_path().string();
        return config;

    } catch (const json::parse_error& e) {
        std::cerr << "JSON parse error in " << filepath << ": " << e.what() << std::endl;
        return std::nullopt;
    } catch (const json::exception& e) {
        std::cerr << "JSON error in " << filepath << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::string get_project_root(const std::string& start_dir) {
    fs::path current = fs::absolute(start_dir);

    while (true) {
        fs::path config_path = current / "mica.json";
        if (fs::exists(config_path)) {
            return current.string();
        }

        if (!current.has_parent_path() || current == current.parent_path()) {
            break;
        }
        current = current.parent_path();
    }

    return "";
}

std::optional<ProjectConfig> find_and_parse_mica_json(const std::string& start_dir) {
    std::string root = get_project_root(start_dir);
    if (root.empty()) {
        return std::nullopt;
    }

    return parse_mica_json((fs::path(root) / "mica.json").string());
}

int run_source(const std::string& source,
    const std::string& filename,
    const ProjectConfig& config,
    const DumpOptions& dumps,
    std::ostream& out,
    std::ostream& err) {
    try {
        Lexer lexer(source, filename);
        std::vector<Token> tokens = lexer.tokenize();
        if (dumps.tokens) print_tokens(tokens, err);

        Parser parser(tokens, config.limits.max_nesting_depth);
        std::unique_ptr<ProgramNode> ast = parser.parse();
        if (dumps.ast) print_program_debug(ast.get(), 0, err);

        EvaluatorOptions options;
        options.max_call_depth = config.limits.max_call_depth;
        Evaluator evaluator(default_builtins(out), options);
        evaluator.evaluate(ast.get());
    } catch (const MicaError& e) {
        bool color = &err == &std::cerr && Color::supports_color(STDERR_FILENO);
        err << Color::paint("Error: ", Color::red, color) << e.what() << std::endl;
        return 1;
    }
    return 0;
}

int run_file(const std::string& filepath, const ProjectConfig& config, const DumpOptions& dumps) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open file " << filepath << std::endl;
        return 1;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    return run_source(buffer.str(), filepath, config, dumps, std::cout, std::cerr);
}

CommandResult cmd_run(const std::vector<std::string>& args, const ProjectConfig& config, const DumpOptions& dumps) {
    std::string entry = args.empty() ? config.entry : args[0];
    if (entry.empty()) {
        return {1, "No entry to run: pass a file or set \"entry\" in mica.json"};
    }

    fs::path p(entry);
    if (p.is_relative() && args.empty() && !config.root.empty()) {
        p = fs::path(config.root) / p;
    }
    if (!fs::exists(p)) {
        return {1, "Entry file not found: " + p.string()};
    }

    int code = run_file(p.string(), config, dumps);
    return {code, ""};
}

CommandResult execute_command(const std::vector<std::string>& args, const ProjectConfig& config, const DumpOptions& dumps) {
    if (args.empty()) {
        return {1, "No command specified"};
    }

    std::string command = args[0];
    std::vector<std::string> sub_args(args.begin() + 1, args.end());

    if (command == "run") {
        return cmd_run(sub_args, config, dumps);
    }
    return {1, "Unknown command: " + command};
}

}  // namespace cli
}  // namespace mica
