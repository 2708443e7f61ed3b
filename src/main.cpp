#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli_commands.hpp"
#include "repl.hpp"

namespace fs = std::filesystem;

static std::optional<fs::path> find_file_with_extension(const fs::path& base) {
    fs::path candidate = base;
    candidate += ".mica";
    if (fs::exists(candidate)) return candidate;
    return std::nullopt;
}

static bool parse_positive(const std::string& text, size_t& out) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) return false;
    try {
        unsigned long long v = std::stoull(text);
        if (v == 0) return false;
        out = static_cast<size_t>(v);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

int main(int argc, char* argv[]) {
    auto print_usage = []() {
        std::cout << "Usage: mica [options] [file]\n"
                  << "       mica run [file]\n"
                  << "Options:\n"
                  << "  -v, --version          Print version and exit\n"
                  << "  -i                     Start REPL (interactive)\n"
                  << "  -h, --help             Show this help message\n"
                  << "  --tokens               Dump tokens to stderr before running\n"
                  << "  --ast                  Dump the syntax tree to stderr before running\n"
                  << "  --max-call-depth N     Limit nested function calls (default "
                  << DEFAULT_MAX_CALL_DEPTH << ")\n"
                  << "\n"
                  << "Without a file, `mica run` runs the \"entry\" of the nearest mica.json.\n"
                  << "If a filename starts with '-', use `--` to end options:\n"
                  << "  mica -- -weird.mica\n";
    };

    mica::cli::ProjectConfig config;
    if (auto found = mica::cli::find_and_parse_mica_json(".")) {
        config = *found;
    }

    mica::cli::DumpOptions dumps;
    bool force_repl = false;
    std::vector<std::string> positional;

    // Simple options parser: scan argv until we hit a non-option or `--`.
    bool seen_double_dash = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (seen_double_dash || !positional.empty()) {
            positional.push_back(arg);
            continue;
        }

        if (arg == "--") {
            seen_double_dash = true;
            continue;
        }

        if (!arg.empty() && arg[0] == '-') {
            if (arg == "-v" || arg == "--version") {
                std::cout << "mica v" << MICA_VERSION << std::endl;
                return 0;
            } else if (arg == "-i") {
                force_repl = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage();
                return 0;
            } else if (arg == "--tokens") {
                dumps.tokens = true;
            } else if (arg == "--ast") {
                dumps.ast = true;
                config.repl.echo_ast = true;
            } else if (arg == "--max-call-depth") {
                if (i + 1 >= argc || !parse_positive(argv[i + 1], config.limits.max_call_depth)) {
                    std::cerr << "mica: --max-call-depth needs a positive integer\n";
                    return 1;
                }
                ++i;
            } else {
                std::cerr << "mica: unknown option '" << arg << "'\n";
                std::cerr << "Try 'mica --help' for more information.\n";
                return 1;
            }
            continue;
        }

        positional.push_back(arg);
    }

    if (force_repl || positional.empty()) {
        run_repl_mode(config);
        return 0;
    }

    if (!seen_double_dash && positional[0] == "run") {
        std::vector<std::string> cmd_args(positional.begin(), positional.end());
        auto result = mica::cli::execute_command(cmd_args, config, dumps);
        if (!result.message.empty()) std::cerr << "mica: " << result.message << "\n";
        return result.exit_code;
    }

    // explicit path, else the same name with the .mica extension
    fs::path p(positional[0]);
    fs::path file_to_run;

    if (fs::exists(p)) {
        file_to_run = p;
    } else if (p.has_extension()) {
        std::cerr << "Error: File not found: " << p << std::endl;
        return 1;
    } else {
        auto found = find_file_with_extension(p);
        if (!found.has_value()) {
            std::cerr << "Error: Could not find file for base name '" << positional[0] << "'. Tried:\n";
            std::cerr << "  " << p.string() << ".mica\n";
            return 1;
        }
        file_to_run = found.value();
    }

    return mica::cli::run_file(file_to_run.string(), config, dumps);
}
