#ifndef SIZE_CACHE_HPP
#define SIZE_CACHE_HPP

#include "FileScanner.hpp"
#include "Types.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace spdlog { class logger; }

/**
 * @brief Memoized per-path sizes.
 *
 * Files report their own size. Directories report the sum of their immediate
 * regular-file children only; subdirectories are never walked. Entries live
 * until explicitly invalidated, so every mutation of a tracked path must call
 * invalidate() and invalidate_parent().
 */
class SizeCache {
public:
    explicit SizeCache(std::shared_ptr<spdlog::logger> logger = nullptr);

    SizeState size_of(const std::filesystem::path& path);
    std::optional<SizeState> peek(const std::filesystem::path& path) const;

    // Drops the path and anything cached below it.
    void invalidate(const std::filesystem::path& path);
    // Drops only the parent directory's own entry.
    void invalidate_parent(const std::filesystem::path& path);
    void clear();

    std::size_t cached_count() const;

private:
    SizeState compute(const std::filesystem::path& path) const;
    SizeState compute_directory(const std::filesystem::path& path) const;
    void drop(const std::string& key, bool with_descendants);
    static std::string key_for(const std::filesystem::path& path);

    FileScanner scanner;
    std::shared_ptr<spdlog::logger> logger;
    mutable std::mutex mutex;
    std::unordered_map<std::string, SizeState> entries;
    std::uint64_t generation{0};
};

#endif
