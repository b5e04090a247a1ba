#include "Utils.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <string.h>

namespace fs = std::filesystem;

namespace Utils {

std::string path_to_utf8(const fs::path& path)
{
    const auto u8 = path.u8string();
    return std::string(u8.begin(), u8.end());
}


fs::path utf8_to_path(const std::string& value)
{
    return fs::path(std::u8string(value.begin(), value.end()));
}


fs::path absolutize(const fs::path& path)
{
    fs::path result = fs::absolute(path).lexically_normal();
    if (!result.has_filename() && result.has_relative_path()) {
        result = result.parent_path();
    }
    return result;
}


bool is_within(const fs::path& path, const fs::path& root)
{
    const fs::path normalized_path = absolutize(path);
    const fs::path normalized_root = absolutize(root);

    auto root_it = normalized_root.begin();
    auto path_it = normalized_path.begin();
    for (; root_it != normalized_root.end(); ++root_it, ++path_it) {
        if (path_it == normalized_path.end() || *path_it != *root_it) {
            return false;
        }
    }
    return true;
}


bool entry_exists(const fs::path& path)
{
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}


bool is_permission_error(const std::error_code& ec)
{
    return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
}


bool is_cross_device_error(const std::error_code& ec)
{
    return ec == std::errc::cross_device_link;
}


fs::path unique_destination(const fs::path& desired)
{
    return unique_destination(desired, [](const fs::path& path) { return entry_exists(path); });
}


fs::path unique_destination(const fs::path& desired, const std::function<bool(const fs::path&)>& exists)
{
    if (!exists(desired)) {
        return desired;
    }

    const fs::path parent = desired.parent_path();
    const std::string file_name = path_to_utf8(desired.filename());

    // A leading dot marks a hidden file, not an extension.
    std::string stem = file_name;
    std::string extension;
    const auto dot = file_name.rfind('.');
    if (dot != std::string::npos && dot > 0) {
        stem = file_name.substr(0, dot);
        extension = file_name.substr(dot);
    }

    for (unsigned counter = 1;; ++counter) {
        fs::path candidate = parent / utf8_to_path(fmt::format("{} ({}){}", stem, counter, extension));
        if (!exists(candidate)) {
            return candidate;
        }
    }
}


std::string format_file_size(std::uintmax_t size)
{
    constexpr std::uintmax_t KB = 1024;
    constexpr std::uintmax_t MB = KB * 1024;
    constexpr std::uintmax_t GB = MB * 1024;

    if (size >= GB) {
        return fmt::format("{:.2f} GB", static_cast<double>(size) / GB);
    }
    if (size >= MB) {
        return fmt::format("{:.2f} MB", static_cast<double>(size) / MB);
    }
    if (size >= KB) {
        return fmt::format("{:.2f} KB", static_cast<double>(size) / KB);
    }
    return fmt::format("{} B", size);
}


std::string get_executable_path()
{
    std::error_code ec;
    const fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) {
        return path_to_utf8(fs::current_path(ec));
    }
    return path_to_utf8(exe.parent_path());
}


std::string abbreviate_user_path(const std::string& path)
{
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return path;
    }
    const fs::path home_path = absolutize(home);
    const fs::path full = absolutize(utf8_to_path(path));
    if (!is_within(full, home_path) || full == home_path) {
        return path;
    }
    return path_to_utf8(full.lexically_relative(home_path));
}



void wipe_string(std::string& secret)
{
    if (!secret.empty()) {
        explicit_bzero(secret.data(), secret.size());
    }
    secret.clear();
}

}
