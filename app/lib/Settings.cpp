#include "Settings.hpp"
#include "Types.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <filesystem>
#include <cstdio>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>


namespace {
constexpr const char* kAppName = "termfiles";
constexpr std::size_t kMinQueueCapacity = 1;
constexpr std::size_t kMaxQueueCapacity = 4096;

template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

std::string env_or_empty(const char* name)
{
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : std::string();
}

bool is_known_log_level(const std::string& value)
{
    return spdlog::level::from_str(value) != spdlog::level::off || value == "off";
}
}


Settings::Settings()
{
    config_path = define_config_path();
    config_dir = std::filesystem::path(config_path).parent_path();

    try {
        if (!std::filesystem::exists(config_dir)) {
            std::filesystem::create_directories(config_dir);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        settings_log(spdlog::level::err, "Error creating configuration directory: {}", e.what());
    }

    trash_dir = default_trash_dir();
    log_dir = Logger::get_default_log_directory();
}


std::string Settings::define_config_path()
{
    if (const std::string override_root = env_or_empty("TERMFILES_CONFIG_DIR"); !override_root.empty()) {
        return (std::filesystem::path(override_root) / "config.ini").string();
    }
    if (const std::string xdg = env_or_empty("XDG_CONFIG_HOME"); !xdg.empty()) {
        return (std::filesystem::path(xdg) / kAppName / "config.ini").string();
    }
    if (const std::string home = env_or_empty("HOME"); !home.empty()) {
        return (std::filesystem::path(home) / ".config" / kAppName / "config.ini").string();
    }
    return "config.ini";
}


std::string Settings::default_trash_dir()
{
    if (const std::string xdg = env_or_empty("XDG_DATA_HOME"); !xdg.empty()) {
        return (std::filesystem::path(xdg) / kAppName / "trash").string();
    }
    if (const std::string home = env_or_empty("HOME"); !home.empty()) {
        return (std::filesystem::path(home) / ".local" / "share" / kAppName / "trash").string();
    }
    return (std::filesystem::temp_directory_path() / "termfiles_trash").string();
}


std::string Settings::get_config_dir()
{
    return config_dir.string();
}


std::string Settings::get_config_path() const
{
    return config_path;
}


bool Settings::load()
{
    if (!config.load(config_path)) {
        return false;
    }

    trash_dir = config.getValue("Paths", "TrashDir", trash_dir);
    log_dir = config.getValue("Paths", "LogDir", log_dir);

    const std::string collision = config.getValue("Operations", "PasteCollision", "rename");
    if (collision == "rename") {
        paste_collision = PasteCollisionPolicy::AutoRename;
    } else if (collision == "fail") {
        paste_collision = PasteCollisionPolicy::Fail;
    } else {
        settings_log(spdlog::level::warn, "Unknown PasteCollision '{}'; using 'rename'", collision);
        paste_collision = PasteCollisionPolicy::AutoRename;
    }

    if (config.hasValue("Operations", "WorkerQueueCapacity")) {
        const auto capacity = config.getInteger("Operations", "WorkerQueueCapacity");
        if (capacity && *capacity >= static_cast<long long>(kMinQueueCapacity)
            && *capacity <= static_cast<long long>(kMaxQueueCapacity)) {
            worker_queue_capacity = static_cast<std::size_t>(*capacity);
        } else {
            settings_log(spdlog::level::warn, "Invalid WorkerQueueCapacity '{}'; using {}",
                         config.getValue("Operations", "WorkerQueueCapacity"), worker_queue_capacity);
        }
    }

    if (config.hasValue("Operations", "UndoLimit")) {
        const auto limit = config.getInteger("Operations", "UndoLimit");
        if (limit && *limit >= 0) {
            undo_limit = static_cast<std::size_t>(*limit);
        } else {
            settings_log(spdlog::level::warn, "Invalid UndoLimit '{}'; using {}",
                         config.getValue("Operations", "UndoLimit"), undo_limit);
        }
    }

    const std::string scope = config.getValue("Escalation", "Scope", "command");
    if (scope == "command") {
        escalation_scope = EscalationScope::SingleCommand;
    } else if (scope == "batch") {
        escalation_scope = EscalationScope::Batch;
    } else {
        settings_log(spdlog::level::warn, "Unknown escalation Scope '{}'; using 'command'", scope);
        escalation_scope = EscalationScope::SingleCommand;
    }

    sudo_path = config.getValue("Escalation", "SudoPath", sudo_path);
    if (sudo_path.empty()) {
        sudo_path = "sudo";
    }

    const std::string level = config.getValue("Logging", "Level", log_level);
    if (is_known_log_level(level)) {
        log_level = level;
    } else {
        settings_log(spdlog::level::warn, "Unknown log Level '{}'; using '{}'", level, log_level);
    }

    if (config.hasValue("View", "ShowHidden")) {
        if (const auto hidden = config.getBool("View", "ShowHidden")) {
            show_hidden = *hidden;
        } else {
            settings_log(spdlog::level::warn, "Invalid ShowHidden '{}'; using false",
                         config.getValue("View", "ShowHidden"));
        }
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Loaded settings from '{}' (trash: '{}', queue capacity: {}, undo limit: {}, escalation scope: {})",
                     config_path,
                     trash_dir,
                     worker_queue_capacity,
                     undo_limit,
                     escalation_scope == EscalationScope::Batch ? "batch" : "command");
    }

    return true;
}


bool Settings::save()
{
    config.setValue("Paths", "TrashDir", trash_dir);
    config.setValue("Paths", "LogDir", log_dir);
    config.setValue("Operations", "PasteCollision",
                    paste_collision == PasteCollisionPolicy::Fail ? "fail" : "rename");
    config.setValue("Operations", "WorkerQueueCapacity", std::to_string(worker_queue_capacity));
    config.setValue("Operations", "UndoLimit", std::to_string(undo_limit));
    config.setValue("Escalation", "Scope",
                    escalation_scope == EscalationScope::Batch ? "batch" : "command");
    config.setValue("Escalation", "SudoPath", sudo_path);
    config.setValue("Logging", "Level", log_level);
    config.setValue("View", "ShowHidden", show_hidden ? "true" : "false");

    return config.save(config_path);
}


std::string Settings::get_trash_dir() const
{
    return trash_dir;
}


void Settings::set_trash_dir(const std::string& path)
{
    trash_dir = path;
}


std::string Settings::get_log_dir() const
{
    return log_dir;
}


void Settings::set_log_dir(const std::string& path)
{
    log_dir = path;
}


PasteCollisionPolicy Settings::get_paste_collision_policy() const
{
    return paste_collision;
}


void Settings::set_paste_collision_policy(PasteCollisionPolicy policy)
{
    paste_collision = policy;
}


std::size_t Settings::get_worker_queue_capacity() const
{
    return worker_queue_capacity;
}


void Settings::set_worker_queue_capacity(std::size_t capacity)
{
    worker_queue_capacity = std::clamp(capacity, kMinQueueCapacity, kMaxQueueCapacity);
}


std::size_t Settings::get_undo_limit() const
{
    return undo_limit;
}


void Settings::set_undo_limit(std::size_t limit)
{
    undo_limit = limit;
}


EscalationScope Settings::get_escalation_scope() const
{
    return escalation_scope;
}


void Settings::set_escalation_scope(EscalationScope scope)
{
    escalation_scope = scope;
}


std::string Settings::get_sudo_path() const
{
    return sudo_path;
}


void Settings::set_sudo_path(const std::string& path)
{
    sudo_path = path.empty() ? std::string("sudo") : path;
}


std::string Settings::get_log_level() const
{
    return log_level;
}


void Settings::set_log_level(const std::string& level)
{
    if (is_known_log_level(level)) {
        log_level = level;
    }
}


bool Settings::get_show_hidden() const
{
    return show_hidden;
}


void Settings::set_show_hidden(bool value)
{
    show_hidden = value;
}
