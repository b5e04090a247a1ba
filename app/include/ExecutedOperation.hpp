#ifndef EXECUTED_OPERATION_HPP
#define EXECUTED_OPERATION_HPP

#include "Command.hpp"
#include "TrashStore.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using PathMove = std::pair<std::filesystem::path, std::filesystem::path>;

struct CopiedEntries {
    CopyCommand command;
    std::vector<std::filesystem::path> created;
};

struct MovedEntries {
    MoveCommand command;
    std::vector<PathMove> moves; // (old location, new location)
};

struct DeletedEntries {
    DeleteCommand command;
    std::vector<TrashEntry> trashed;
};

struct RenamedEntry {
    RenameCommand command;
    std::filesystem::path previous_path;
    std::filesystem::path new_path;
};

struct CreatedEntry {
    CreateNewCommand command;
    std::filesystem::path created;
};

struct RestoredEntries {
    std::vector<TrashEntry> restored;
};

struct RelocatedEntries {
    std::vector<PathMove> moves; // (location before undo, location after undo)
};

/**
 * @brief A command that was applied, with what is needed to reverse it.
 *
 * RestoredEntries and RelocatedEntries are produced by applying an inverse
 * and have no inverse of their own; they are never recorded for undo.
 */
using ExecutedOperation = std::variant<CopiedEntries,
                                       MovedEntries,
                                       DeletedEntries,
                                       RenamedEntry,
                                       CreatedEntry,
                                       RestoredEntries,
                                       RelocatedEntries>;

std::string describe(const ExecutedOperation& operation);

bool is_undoable(const ExecutedOperation& operation);

// The command that reverses `operation`, or nullopt when it is not undoable.
std::optional<Command> inverse_of(const ExecutedOperation& operation);

/**
 * @brief What is left of `original` after its inverse was only partly applied.
 * @param reversed The ExecutedOperation reported for the inverse command.
 * @return nullopt when nothing is left to undo.
 */
std::optional<ExecutedOperation> remainder_after_undo(const ExecutedOperation& original,
                                                      const ExecutedOperation& reversed);

// Every path the operation created, removed or moved.
std::vector<std::filesystem::path> touched_paths(const ExecutedOperation& operation);

#endif
