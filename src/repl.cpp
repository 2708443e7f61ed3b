#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "colors.hpp"
#include "linenoise.h"
#include "repl.hpp"

namespace fs = std::filesystem;

static std::optional<fs::path> get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') return fs::path(home);
    return std::nullopt;
}

static fs::path history_file_in_home() {
    auto home = get_home_dir();
    if (home.has_value()) {
        return home.value() / ".mica_history";
    }
    return fs::current_path() / ".mica_history";
}

void run_repl_mode(const mica::cli::ProjectConfig& config) {
    ReplSession session(config, std::cout, std::cerr, Color::supports_color(STDERR_FILENO));

    std::cout << "mica v" << MICA_VERSION << " | built on " << __DATE__ << "\n";
    std::cout << "Mica REPL: type 'exit', an empty line or Ctrl-D to quit\n";

    fs::path history_path = history_file_in_home();
    if (config.repl.history) {
        linenoiseHistoryLoad(history_path.string().c_str());
    }

    std::string last_added_history;

    while (true) {
        char* raw = linenoise(session.prompt());
        if (!raw) {  // EOF (Ctrl-D) or error
            std::cout << "\n";
            break;
        }

        std::string line(raw);
        linenoiseFree(raw);

        if (config.repl.history && !line.empty() && line != last_added_history) {
            linenoiseHistoryAdd(line.c_str());
            last_added_history = line;
        }

        if (session.feed_line(line) == ReplStatus::Exit) break;
    }

    if (config.repl.history) {
        linenoiseHistorySave(history_path.string().c_str());
    }
}
