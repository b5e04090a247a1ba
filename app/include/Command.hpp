#ifndef COMMAND_HPP
#define COMMAND_HPP

#include "TrashStore.hpp"
#include "Types.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <variant>
#include <vector>

struct CopyCommand {
    std::vector<std::filesystem::path> sources;
    std::filesystem::path destination;
};

// Cut-paste
struct MoveCommand {
    std::vector<std::filesystem::path> sources;
    std::filesystem::path destination;
};

struct DeleteCommand {
    std::vector<std::filesystem::path> targets;
};

struct RenameCommand {
    std::filesystem::path target;
    std::string new_name;
};

struct CreateNewCommand {
    std::filesystem::path parent;
    std::string name;
    CreationKind kind{CreationKind::File};
};

// Inverse of a delete: brings trash entries back to where they came from.
struct RestoreCommand {
    std::vector<TrashEntry> entries;
};

// Inverse of a move or rename: each pair is (current location, location to return to).
struct RelocateCommand {
    std::vector<std::pair<std::filesystem::path, std::filesystem::path>> moves;
};

using Command = std::variant<CopyCommand,
                             MoveCommand,
                             DeleteCommand,
                             RenameCommand,
                             CreateNewCommand,
                             RestoreCommand,
                             RelocateCommand>;

std::string describe(const Command& command);

// Number of top-level paths the command acts on.
std::size_t target_count(const Command& command);

// The top-level paths the command acts on, as given.
std::vector<std::filesystem::path> target_paths(const Command& command);

/**
 * @brief Builds commands from a selection and validates names.
 *
 * Throws ErrorCodes::AppException with a validation code when the request can
 * be rejected up front. Nothing here touches the filesystem except to read it;
 * the engine checks every path again right before applying.
 */
class CommandBuilder {
public:
    static Command copy(const std::vector<std::filesystem::path>& selection,
                        const std::filesystem::path& destination);
    static Command move(const std::vector<std::filesystem::path>& selection,
                        const std::filesystem::path& destination);
    static Command remove(const std::vector<std::filesystem::path>& selection);
    static Command rename(const std::filesystem::path& target, const std::string& new_name);
    static Command create(const std::filesystem::path& parent, const std::string& name, CreationKind kind);

    // Non-empty, not "." or "..", no '/' and no NUL.
    static bool is_valid_name(const std::string& name);
    static void validate_name(const std::string& name);

private:
    static std::vector<std::filesystem::path> absolutize_selection(
        const std::vector<std::filesystem::path>& selection);
};

#endif
