#include "Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <cstdlib>
#include <filesystem>
#include <vector>

namespace {
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
constexpr std::array<const char*, 3> kLoggerNames = {"core_logger", "ui_logger", "security_logger"};
}


std::string Logger::get_default_log_directory()
{
    if (const char* state_home = std::getenv("XDG_STATE_HOME"); state_home && *state_home) {
        return (std::filesystem::path(state_home) / "termfiles" / "logs").string();
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return (std::filesystem::path(home) / ".local" / "state" / "termfiles" / "logs").string();
    }
    return (std::filesystem::temp_directory_path() / "termfiles" / "logs").string();
}


std::string Logger::get_log_file_path(const std::string& log_dir)
{
    const std::filesystem::path dir = log_dir.empty() ? get_default_log_directory() : log_dir;
    std::filesystem::create_directories(dir);
    return (dir / "termfiles.log").string();
}


void Logger::setup_loggers(const std::string& log_dir, spdlog::level::level_enum level)
{
    const std::string log_file = get_log_file_path(log_dir);

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, kMaxLogFileSize, kMaxLogFiles);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");

    // The terminal belongs to the UI; only problems go to stderr.
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);
    console_sink->set_pattern("%^[%l]%$ %v");

    std::vector<spdlog::sink_ptr> sinks{file_sink, console_sink};

    for (const char* name : kLoggerNames) {
        if (spdlog::get(name)) {
            spdlog::drop(name);
        }
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}


void Logger::set_level(spdlog::level::level_enum level)
{
    for (const char* name : kLoggerNames) {
        if (auto logger = spdlog::get(name)) {
            logger->set_level(level);
        }
    }
}
