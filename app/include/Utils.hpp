#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>

namespace Utils {

std::string path_to_utf8(const std::filesystem::path& path);
std::filesystem::path utf8_to_path(const std::string& value);

// Absolute, lexically normalized, without a trailing separator.
std::filesystem::path absolutize(const std::filesystem::path& path);

// True when `path` equals `root` or lies below it (lexical comparison).
bool is_within(const std::filesystem::path& path, const std::filesystem::path& root);

// Exists without following a final symlink.
bool entry_exists(const std::filesystem::path& path);

bool is_permission_error(const std::error_code& ec);
bool is_cross_device_error(const std::error_code& ec);

/**
 * @brief Returns `desired` when free, otherwise the first free "name (N).ext" sibling.
 */
std::filesystem::path unique_destination(const std::filesystem::path& desired);
std::filesystem::path unique_destination(const std::filesystem::path& desired,
                                         const std::function<bool(const std::filesystem::path&)>& exists);

// Directory holding the running executable.
std::string get_executable_path();

std::string format_file_size(std::uintmax_t size);

std::string abbreviate_user_path(const std::string& path);

// Overwrites the characters in place before clearing, so secrets do not linger in freed memory.
void wipe_string(std::string& secret);

}

#endif
