#ifndef TRASH_STORE_HPP
#define TRASH_STORE_HPP

#include <ctime>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

class FileMutator;
namespace spdlog { class logger; }

struct TrashEntry {
    std::filesystem::path original_path;
    std::string trash_name;
    std::filesystem::path trash_path;
    std::time_t deleted_at{0};
};

/**
 * @brief Deleted entries live under one root as "<unix-timestamp>-<basename>".
 *
 * When that name is already taken (same basename deleted twice in one second),
 * the timestamp field gets a sequence suffix: "<unix-timestamp>.<n>-<basename>".
 * Manual recovery depends on this layout, so it must stay stable.
 */
class TrashStore {
public:
    using Clock = std::function<std::time_t()>;

    struct ParsedName {
        std::time_t timestamp{0};
        unsigned sequence{0};
        std::string basename;
    };

    explicit TrashStore(std::filesystem::path root, Clock clock = {},
                        std::shared_ptr<spdlog::logger> logger = nullptr);

    TrashEntry trash(const std::filesystem::path& path, FileMutator& mutator);
    void restore(const TrashEntry& entry, FileMutator& mutator);

    std::vector<TrashEntry> list() const;
    bool contains(const std::filesystem::path& path) const;
    const std::filesystem::path& root() const;

    static std::string make_trash_name(std::time_t timestamp, unsigned sequence, const std::string& basename);
    static std::optional<ParsedName> parse_trash_name(const std::string& name);

private:
    void ensure_root();
    std::string reserve_name(std::time_t timestamp, const std::string& basename);
    void release_name(const std::string& name);

    std::filesystem::path root_;
    Clock clock_;
    std::shared_ptr<spdlog::logger> logger_;
    mutable std::mutex mutex_;
    std::unordered_set<std::string> reserved_;
    std::unordered_map<std::string, std::filesystem::path> originals_;
};

#endif
