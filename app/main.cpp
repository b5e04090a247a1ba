#include "ConsoleApp.hpp"
#include "Logger.hpp"
#include "Settings.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include <locale.h>
#include <libintl.h>


bool initialize_loggers(const std::string& log_dir, spdlog::level::level_enum level)
{
    try {
        Logger::setup_loggers(log_dir, level);
        return true;
    } catch (const std::exception &e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Failed to initialize loggers: {}", e.what());
        } else {
            std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        }
        return false;
    }
}

namespace {

struct ParsedArguments {
    std::optional<std::string> config_dir;
    std::optional<std::string> log_level;
    std::string start_dir;
    bool show_usage{false};
    std::string error;
};

void print_usage(std::FILE* stream)
{
    std::fprintf(stream,
                 "usage: termfiles [--config-dir DIR] [--log-level LEVEL] [START_DIR]\n"
                 "  --config-dir DIR   read and write config.ini in DIR\n"
                 "  --log-level LEVEL  trace, debug, info, warn, err, critical or off\n");
}

ParsedArguments parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            parsed.show_usage = true;
        } else if (std::strcmp(arg, "--config-dir") == 0 || std::strcmp(arg, "--log-level") == 0) {
            if (i + 1 >= argc) {
                parsed.error = std::string("missing value for ") + arg;
                return parsed;
            }
            if (std::strcmp(arg, "--config-dir") == 0) {
                parsed.config_dir = argv[++i];
            } else {
                parsed.log_level = argv[++i];
            }
        } else if (arg[0] == '-' && arg[1] != '\0') {
            parsed.error = std::string("unknown option ") + arg;
            return parsed;
        } else if (parsed.start_dir.empty()) {
            parsed.start_dir = arg;
        } else {
            parsed.error = "only one START_DIR may be given";
            return parsed;
        }
    }
    return parsed;
}

int run_application(const ParsedArguments& args)
{
    setlocale(LC_ALL, "");
    const std::string locale_path = Utils::get_executable_path() + "/locale";
    bindtextdomain("termfiles", locale_path.c_str());
    textdomain("termfiles");

    if (args.config_dir) {
        setenv("TERMFILES_CONFIG_DIR", args.config_dir->c_str(), 1);
    }

    Settings settings;
    settings.load();
    if (args.log_level) {
        settings.set_log_level(*args.log_level);
    }

    if (!initialize_loggers(settings.get_log_dir(), spdlog::level::from_str(settings.get_log_level()))) {
        return EXIT_FAILURE;
    }

    std::filesystem::path start_dir = args.start_dir.empty()
        ? std::filesystem::current_path()
        : Utils::utf8_to_path(args.start_dir);
    if (!std::filesystem::is_directory(start_dir)) {
        std::fprintf(stderr, "termfiles: '%s' is not a directory\n", args.start_dir.c_str());
        return EXIT_FAILURE;
    }

    ConsoleApp app(settings, start_dir, std::cin, std::cout);
    const int result = app.run();
    spdlog::shutdown();
    return result;
}

} // namespace


int main(int argc, char **argv) {
    const ParsedArguments args = parse_command_line(argc, argv);
    if (!args.error.empty()) {
        std::fprintf(stderr, "termfiles: %s\n", args.error.c_str());
        print_usage(stderr);
        return EXIT_FAILURE;
    }
    if (args.show_usage) {
        print_usage(stdout);
        return EXIT_SUCCESS;
    }

    try {
        return run_application(args);
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        return EXIT_FAILURE;
    }
}
