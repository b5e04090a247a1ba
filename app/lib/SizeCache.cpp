#include "SizeCache.hpp"

#include "Utils.hpp"

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

SizeCache::SizeCache(std::shared_ptr<spdlog::logger> logger)
    : logger(std::move(logger))
{
}


std::string SizeCache::key_for(const fs::path& path)
{
    return Utils::path_to_utf8(Utils::absolutize(path));
}


SizeState SizeCache::size_of(const fs::path& path)
{
    const std::string key = key_for(path);
    std::uint64_t started_at = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (const auto it = entries.find(key); it != entries.end()) {
            return it->second;
        }
        started_at = generation;
    }

    SizeState state = compute(Utils::utf8_to_path(key));

    // An invalidation that raced with compute() means the result may be stale; hand it out uncached.
    std::lock_guard<std::mutex> lock(mutex);
    if (generation != started_at) {
        return state;
    }
    return entries.try_emplace(key, std::move(state)).first->second;
}


std::optional<SizeState> SizeCache::peek(const fs::path& path) const
{
    const std::string key = key_for(path);
    std::lock_guard<std::mutex> lock(mutex);
    if (const auto it = entries.find(key); it != entries.end()) {
        return it->second;
    }
    return std::nullopt;
}


void SizeCache::invalidate(const fs::path& path)
{
    drop(key_for(path), true);
}


void SizeCache::invalidate_parent(const fs::path& path)
{
    const fs::path absolute = Utils::absolutize(path);
    if (absolute.has_parent_path() && absolute.parent_path() != absolute) {
        drop(key_for(absolute.parent_path()), false);
    }
}


void SizeCache::drop(const std::string& key, bool with_descendants)
{
    const std::string prefix = key.ends_with('/') ? key : key + "/";
    std::lock_guard<std::mutex> lock(mutex);
    ++generation;
    std::size_t dropped = 0;
    for (auto it = entries.begin(); it != entries.end();) {
        if (it->first == key || (with_descendants && it->first.starts_with(prefix))) {
            it = entries.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    if (dropped > 0 && logger) {
        logger->trace("Size cache dropped {} entr{} at '{}'", dropped, dropped == 1 ? "y" : "ies", key);
    }
}


void SizeCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex);
    ++generation;
    entries.clear();
}


std::size_t SizeCache::cached_count() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
}


SizeState SizeCache::compute(const fs::path& path) const
{
    std::error_code ec;
    const fs::file_status link_status = fs::symlink_status(path, ec);
    if (ec || !fs::exists(link_status)) {
        return SizeState::unavailable("no such file or directory");
    }

    // Links are sized by what they point to, like the listing shows them.
    const fs::file_status status = fs::is_symlink(link_status) ? fs::status(path, ec) : link_status;
    if (ec || !fs::exists(status)) {
        return SizeState::unavailable("dangling symbolic link");
    }

    if (fs::is_directory(status)) {
        return compute_directory(path);
    }
    if (fs::is_regular_file(status)) {
        const auto bytes = fs::file_size(path, ec);
        if (ec) {
            return SizeState::unavailable(ec.message());
        }
        return SizeState::computed(bytes);
    }
    return SizeState::unavailable("not a regular file");
}


SizeState SizeCache::compute_directory(const fs::path& path) const
{
    std::vector<FileEntry> children;
    try {
        children = scanner.get_directory_entries(Utils::path_to_utf8(path),
                                                 FileScanOptions::Files | FileScanOptions::HiddenFiles);
    } catch (const fs::filesystem_error& ex) {
        return SizeState::unavailable(ex.code().message());
    }

    std::uintmax_t total = 0;
    for (const auto& child : children) {
        if (child.kind != FileKind::File) {
            continue;
        }
        std::error_code ec;
        const auto bytes = fs::file_size(Utils::utf8_to_path(child.full_path), ec);
        if (!ec) {
            total += bytes;
        } else if (logger) {
            logger->debug("Skipping '{}' in size of '{}': {}", child.full_path, Utils::path_to_utf8(path), ec.message());
        }
    }
    return SizeState::computed(total);
}
