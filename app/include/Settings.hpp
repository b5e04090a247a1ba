#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <Types.hpp>
#include <cstddef>
#include <string>
#include <filesystem>


class Settings
{
public:
    Settings();

    bool load();
    bool save();

    std::string get_trash_dir() const;
    void set_trash_dir(const std::string& path);

    std::string get_log_dir() const;
    void set_log_dir(const std::string& path);

    PasteCollisionPolicy get_paste_collision_policy() const;
    void set_paste_collision_policy(PasteCollisionPolicy policy);

    std::size_t get_worker_queue_capacity() const;
    void set_worker_queue_capacity(std::size_t capacity);

    std::size_t get_undo_limit() const;
    void set_undo_limit(std::size_t limit);

    EscalationScope get_escalation_scope() const;
    void set_escalation_scope(EscalationScope scope);

    std::string get_sudo_path() const;
    void set_sudo_path(const std::string& path);

    std::string get_log_level() const;
    void set_log_level(const std::string& level);

    bool get_show_hidden() const;
    void set_show_hidden(bool value);

    std::string define_config_path();
    std::string get_config_dir();
    std::string get_config_path() const;

    static std::string default_trash_dir();

private:
    std::string config_path;
    std::filesystem::path config_dir;
    IniConfig config;

    std::string trash_dir;
    std::string log_dir;
    PasteCollisionPolicy paste_collision{PasteCollisionPolicy::AutoRename};
    std::size_t worker_queue_capacity{32};
    std::size_t undo_limit{256};
    EscalationScope escalation_scope{EscalationScope::SingleCommand};
    std::string sudo_path{"sudo"};
    std::string log_level{"info"};
    bool show_hidden{false};
};

#endif
