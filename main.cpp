#include "app_state.hpp"
#include "tui.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace fs = std::filesystem;

namespace {

void print_usage(std::ostream& out) {
    out << "Usage: tree_explorer [-h|--help] [--log FILE] [--hidden] [ROOT]\n"
        << "\n"
        << "  ROOT          directory to browse (default: current directory)\n"
        << "  --hidden      start with hidden files shown\n"
        << "  --log FILE    write a debug log to FILE (also TREE_EXPLORER_LOG)\n"
        << "\n"
        << "Files are opened with $EDITOR (default: vim).\n";
}

// The TUI owns the terminal, so logging is off unless a file was asked for.
void setup_logging(const std::string& log_file) {
    if (log_file.empty()) {
        spdlog::set_level(spdlog::level::off);
        return;
    }

    try {
        auto logger = spdlog::basic_logger_mt("tree_explorer", log_file);
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::debug);
        spdlog::flush_on(spdlog::level::info);
    }
    catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Failed to open log file " << log_file << ": " << ex.what() << "\n";
        spdlog::set_level(spdlog::level::off);
    }
}

}

int main(int argc, char** argv) {
    std::string log_file;
    if (const char* env = std::getenv("TREE_EXPLORER_LOG")) {
        log_file = env;
    }

    bool show_hidden { false };
    std::string root_arg;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(std::cout);
            return 0;
        }
        if (arg == "--hidden") {
            show_hidden = true;
        }
        else if (arg == "--log") {
            if (i + 1 >= argc) {
                std::cerr << "--log needs a file name\n";
                print_usage(std::cerr);
                return 1;
            }
            log_file = argv[++i];
        }
        else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option " << arg << "\n";
            print_usage(std::cerr);
            return 1;
        }
        else if (root_arg.empty()) {
            root_arg = arg;
        }
        else {
            std::cerr << "Only one root directory can be given\n";
            print_usage(std::cerr);
            return 1;
        }
    }

    setup_logging(log_file);

    std::error_code ec;
    fs::path root = root_arg.empty() ? fs::current_path(ec) : fs::path {root_arg};
    if (ec) {
        std::cerr << "Cannot determine current directory: " << ec.message() << "\n";
        return 1;
    }

    root = fs::canonical(root, ec);
    if (ec || !fs::is_directory(root, ec)) {
        std::cerr << "Not a directory: " << (root_arg.empty() ? root.string() : root_arg) << "\n";
        return 1;
    }

    spdlog::info("starting in {}", root.string());
    auto state = std::make_shared<AppState>(root, show_hidden);

    run_tui(state);

    spdlog::info("exiting");
    return 0;
}
