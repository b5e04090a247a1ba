#include "ExecutedOperation.hpp"

#include "Utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <set>
#include <type_traits>

namespace fs = std::filesystem;

namespace {

// Paths that the inverse command already moved out of the way.
std::set<fs::path> paths_removed_by(const ExecutedOperation& reversed)
{
    std::set<fs::path> paths;
    if (const auto* deleted = std::get_if<DeletedEntries>(&reversed)) {
        for (const auto& entry : deleted->trashed) {
            paths.insert(entry.original_path);
        }
    } else if (const auto* relocated = std::get_if<RelocatedEntries>(&reversed)) {
        for (const auto& move : relocated->moves) {
            paths.insert(move.first);
        }
    } else if (const auto* restored = std::get_if<RestoredEntries>(&reversed)) {
        for (const auto& entry : restored->restored) {
            paths.insert(entry.trash_path);
        }
    }
    return paths;
}

}


std::string describe(const ExecutedOperation& operation)
{
    return std::visit([](const auto& op) -> std::string {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, RestoredEntries>) {
            return fmt::format("Restored {} item(s) from trash", op.restored.size());
        } else if constexpr (std::is_same_v<T, RelocatedEntries>) {
            return fmt::format("Moved {} item(s) back", op.moves.size());
        } else {
            return describe(Command{op.command});
        }
    }, operation);
}


bool is_undoable(const ExecutedOperation& operation)
{
    return !std::holds_alternative<RestoredEntries>(operation)
        && !std::holds_alternative<RelocatedEntries>(operation);
}


std::optional<Command> inverse_of(const ExecutedOperation& operation)
{
    return std::visit([](const auto& op) -> std::optional<Command> {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, CopiedEntries>) {
            return DeleteCommand{op.created};
        } else if constexpr (std::is_same_v<T, CreatedEntry>) {
            return DeleteCommand{{op.created}};
        } else if constexpr (std::is_same_v<T, DeletedEntries>) {
            return RestoreCommand{op.trashed};
        } else if constexpr (std::is_same_v<T, MovedEntries>) {
            RelocateCommand inverse;
            // Undo in reverse order so nested moves unwind cleanly.
            for (auto it = op.moves.rbegin(); it != op.moves.rend(); ++it) {
                inverse.moves.emplace_back(it->second, it->first);
            }
            return inverse;
        } else if constexpr (std::is_same_v<T, RenamedEntry>) {
            return RelocateCommand{{{op.new_path, op.previous_path}}};
        } else {
            return std::nullopt;
        }
    }, operation);
}


std::optional<ExecutedOperation> remainder_after_undo(const ExecutedOperation& original,
                                                      const ExecutedOperation& reversed)
{
    const std::set<fs::path> done = paths_removed_by(reversed);

    return std::visit([&done](const auto& op) -> std::optional<ExecutedOperation> {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, CopiedEntries>) {
            CopiedEntries left{op.command, {}};
            std::copy_if(op.created.begin(), op.created.end(), std::back_inserter(left.created),
                         [&done](const fs::path& path) { return !done.contains(path); });
            if (left.created.empty()) {
                return std::nullopt;
            }
            return left;
        } else if constexpr (std::is_same_v<T, CreatedEntry>) {
            if (done.contains(op.created)) {
                return std::nullopt;
            }
            return op;
        } else if constexpr (std::is_same_v<T, DeletedEntries>) {
            DeletedEntries left{op.command, {}};
            std::copy_if(op.trashed.begin(), op.trashed.end(), std::back_inserter(left.trashed),
                         [&done](const TrashEntry& entry) { return !done.contains(entry.trash_path); });
            if (left.trashed.empty()) {
                return std::nullopt;
            }
            return left;
        } else if constexpr (std::is_same_v<T, MovedEntries>) {
            MovedEntries left{op.command, {}};
            std::copy_if(op.moves.begin(), op.moves.end(), std::back_inserter(left.moves),
                         [&done](const PathMove& move) { return !done.contains(move.second); });
            if (left.moves.empty()) {
                return std::nullopt;
            }
            return left;
        } else if constexpr (std::is_same_v<T, RenamedEntry>) {
            if (done.contains(op.new_path)) {
                return std::nullopt;
            }
            return op;
        } else {
            return std::nullopt;
        }
    }, original);
}


std::vector<fs::path> touched_paths(const ExecutedOperation& operation)
{
    std::vector<fs::path> paths;
    std::visit([&paths](const auto& op) {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, CopiedEntries>) {
            paths = op.created;
        } else if constexpr (std::is_same_v<T, CreatedEntry>) {
            paths.push_back(op.created);
        } else if constexpr (std::is_same_v<T, DeletedEntries>) {
            for (const auto& entry : op.trashed) {
                paths.push_back(entry.original_path);
                paths.push_back(entry.trash_path);
            }
        } else if constexpr (std::is_same_v<T, RestoredEntries>) {
            for (const auto& entry : op.restored) {
                paths.push_back(entry.original_path);
                paths.push_back(entry.trash_path);
            }
        } else if constexpr (std::is_same_v<T, RenamedEntry>) {
            paths.push_back(op.previous_path);
            paths.push_back(op.new_path);
        } else {
            for (const auto& move : op.moves) {
                paths.push_back(move.first);
                paths.push_back(move.second);
            }
        }
    }, operation);
    return paths;
}
