#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

class Logger {
public:
    // Creates core_logger, ui_logger and security_logger, all writing to one rotating file.
    static void setup_loggers(const std::string& log_dir = {},
                              spdlog::level::level_enum level = spdlog::level::info);
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);
    static void set_level(spdlog::level::level_enum level);
    static std::string get_default_log_directory();

private:
    static std::string get_log_file_path(const std::string& log_dir);
};

#endif
