#include "TrashStore.hpp"

#include "AppException.hpp"
#include "FileMutator.hpp"
#include "FileTransfer.hpp"
#include "Utils.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>

namespace fs = std::filesystem;

namespace {

std::time_t system_now()
{
    return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

bool all_digits(const std::string& value)
{
    return !value.empty() && std::all_of(value.begin(), value.end(),
                                         [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

}


TrashStore::TrashStore(fs::path root, Clock clock, std::shared_ptr<spdlog::logger> logger)
    : root_(Utils::absolutize(root)),
      clock_(clock ? std::move(clock) : Clock(system_now)),
      logger_(std::move(logger))
{
}


const fs::path& TrashStore::root() const
{
    return root_;
}


bool TrashStore::contains(const fs::path& path) const
{
    return Utils::is_within(path, root_);
}


std::string TrashStore::make_trash_name(std::time_t timestamp, unsigned sequence, const std::string& basename)
{
    if (sequence == 0) {
        return fmt::format("{}-{}", static_cast<long long>(timestamp), basename);
    }
    return fmt::format("{}.{}-{}", static_cast<long long>(timestamp), sequence, basename);
}


std::optional<TrashStore::ParsedName> TrashStore::parse_trash_name(const std::string& name)
{
    const auto dash = name.find('-');
    if (dash == std::string::npos || dash + 1 >= name.size()) {
        return std::nullopt;
    }

    const std::string stamp = name.substr(0, dash);
    std::string seconds = stamp;
    std::string sequence;
    if (const auto dot = stamp.find('.'); dot != std::string::npos) {
        seconds = stamp.substr(0, dot);
        sequence = stamp.substr(dot + 1);
        if (!all_digits(sequence)) {
            return std::nullopt;
        }
    }
    if (!all_digits(seconds)) {
        return std::nullopt;
    }

    try {
        ParsedName parsed;
        parsed.timestamp = static_cast<std::time_t>(std::stoll(seconds));
        parsed.sequence = sequence.empty() ? 0u : static_cast<unsigned>(std::stoul(sequence));
        parsed.basename = name.substr(dash + 1);
        return parsed;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}


void TrashStore::ensure_root()
{
    std::error_code ec;
    if (fs::is_directory(root_, ec)) {
        return;
    }
    fs::create_directories(root_, ec);
    if (ec || !fs::is_directory(root_)) {
        if (logger_) {
            logger_->error("Cannot create trash directory '{}': {}", Utils::path_to_utf8(root_), ec.message());
        }
        THROW_APP_ERROR(ErrorCodes::Code::TRASH_UNAVAILABLE, Utils::path_to_utf8(root_));
    }
    if (logger_) {
        logger_->info("Created trash directory '{}'", Utils::path_to_utf8(root_));
    }
}


std::string TrashStore::reserve_name(std::time_t timestamp, const std::string& basename)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (unsigned sequence = 0;; ++sequence) {
        std::string candidate = make_trash_name(timestamp, sequence, basename);
        if (reserved_.contains(candidate) || Utils::entry_exists(root_ / Utils::utf8_to_path(candidate))) {
            continue;
        }
        reserved_.insert(candidate);
        return candidate;
    }
}


void TrashStore::release_name(const std::string& name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    reserved_.erase(name);
}


TrashEntry TrashStore::trash(const fs::path& path, FileMutator& mutator)
{
    const fs::path source = Utils::absolutize(path);
    if (contains(source)) {
        THROW_APP_ERROR(ErrorCodes::Code::TRASH_SELF_DELETE, Utils::path_to_utf8(source));
    }
    if (!mutator.entry_exists(source)) {
        THROW_APP_ERROR(ErrorCodes::Code::PATH_NOT_FOUND, Utils::path_to_utf8(source));
    }

    ensure_root();

    TrashEntry entry;
    entry.original_path = source;
    entry.deleted_at = clock_();
    entry.trash_name = reserve_name(entry.deleted_at, Utils::path_to_utf8(source.filename()));
    entry.trash_path = root_ / Utils::utf8_to_path(entry.trash_name);

    try {
        FileTransfer::move_path(source, entry.trash_path, mutator);
    } catch (...) {
        release_name(entry.trash_name);
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        reserved_.erase(entry.trash_name);
        originals_[entry.trash_name] = entry.original_path;
    }

    if (logger_) {
        logger_->info("Moved '{}' to trash as '{}'", Utils::path_to_utf8(source), entry.trash_name);
    }
    return entry;
}


void TrashStore::restore(const TrashEntry& entry, FileMutator& mutator)
{
    if (!Utils::entry_exists(entry.trash_path)) {
        THROW_APP_ERROR(ErrorCodes::Code::TRASH_ENTRY_MISSING, Utils::path_to_utf8(entry.trash_path));
    }
    if (mutator.entry_exists(entry.original_path)) {
        if (logger_) {
            logger_->warn("Restore of '{}' blocked: '{}' is occupied", entry.trash_name,
                          Utils::path_to_utf8(entry.original_path));
        }
        THROW_APP_ERROR(ErrorCodes::Code::RESTORE_CONFLICT, Utils::path_to_utf8(entry.original_path));
    }

    FileTransfer::move_path(entry.trash_path, entry.original_path, mutator);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        originals_.erase(entry.trash_name);
    }

    if (logger_) {
        logger_->info("Restored '{}' to '{}'", entry.trash_name, Utils::path_to_utf8(entry.original_path));
    }
}


std::vector<TrashEntry> TrashStore::list() const
{
    std::vector<TrashEntry> entries;
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return entries;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& item : fs::directory_iterator(root_, ec)) {
        const std::string name = Utils::path_to_utf8(item.path().filename());
        const auto parsed = parse_trash_name(name);
        if (!parsed) {
            continue;
        }
        TrashEntry entry;
        entry.trash_name = name;
        entry.trash_path = item.path();
        entry.deleted_at = parsed->timestamp;
        if (const auto it = originals_.find(name); it != originals_.end()) {
            entry.original_path = it->second;
        } else {
            entry.original_path = Utils::utf8_to_path(parsed->basename);
        }
        entries.push_back(std::move(entry));
    }
    if (ec && logger_) {
        logger_->warn("Listing trash '{}' failed: {}", Utils::path_to_utf8(root_), ec.message());
    }

    std::sort(entries.begin(), entries.end(), [](const TrashEntry& lhs, const TrashEntry& rhs) {
        if (lhs.deleted_at != rhs.deleted_at) {
            return lhs.deleted_at < rhs.deleted_at;
        }
        return lhs.trash_name < rhs.trash_name;
    });
    return entries;
}
