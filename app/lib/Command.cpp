#include "Command.hpp"

#include "AppException.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <type_traits>

namespace fs = std::filesystem;

namespace {

std::string describe_paths(const std::vector<fs::path>& paths)
{
    if (paths.size() == 1) {
        return fmt::format("'{}'", Utils::path_to_utf8(paths.front().filename()));
    }
    return fmt::format("{} items", paths.size());
}

}


std::string describe(const Command& command)
{
    return std::visit([](const auto& cmd) -> std::string {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, CopyCommand>) {
            return fmt::format("Copy {} to '{}'", describe_paths(cmd.sources),
                               Utils::path_to_utf8(cmd.destination));
        } else if constexpr (std::is_same_v<T, MoveCommand>) {
            return fmt::format("Move {} to '{}'", describe_paths(cmd.sources),
                               Utils::path_to_utf8(cmd.destination));
        } else if constexpr (std::is_same_v<T, DeleteCommand>) {
            return fmt::format("Delete {}", describe_paths(cmd.targets));
        } else if constexpr (std::is_same_v<T, RenameCommand>) {
            return fmt::format("Rename '{}' to '{}'", Utils::path_to_utf8(cmd.target.filename()), cmd.new_name);
        } else if constexpr (std::is_same_v<T, CreateNewCommand>) {
            return fmt::format("Create {} '{}'", to_string(cmd.kind), cmd.name);
        } else if constexpr (std::is_same_v<T, RestoreCommand>) {
            if (cmd.entries.size() == 1) {
                return fmt::format("Restore '{}'", Utils::path_to_utf8(cmd.entries.front().original_path));
            }
            return fmt::format("Restore {} items", cmd.entries.size());
        } else {
            if (cmd.moves.size() == 1) {
                return fmt::format("Move '{}' back to '{}'",
                                   Utils::path_to_utf8(cmd.moves.front().first.filename()),
                                   Utils::path_to_utf8(cmd.moves.front().second));
            }
            return fmt::format("Move {} items back", cmd.moves.size());
        }
    }, command);
}


std::size_t target_count(const Command& command)
{
    return std::visit([](const auto& cmd) -> std::size_t {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, CopyCommand> || std::is_same_v<T, MoveCommand>) {
            return cmd.sources.size();
        } else if constexpr (std::is_same_v<T, DeleteCommand>) {
            return cmd.targets.size();
        } else if constexpr (std::is_same_v<T, RestoreCommand>) {
            return cmd.entries.size();
        } else if constexpr (std::is_same_v<T, RelocateCommand>) {
            return cmd.moves.size();
        } else {
            return 1;
        }
    }, command);
}


std::vector<fs::path> target_paths(const Command& command)
{
    return std::visit([](const auto& cmd) -> std::vector<fs::path> {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, CopyCommand> || std::is_same_v<T, MoveCommand>) {
            return cmd.sources;
        } else if constexpr (std::is_same_v<T, DeleteCommand>) {
            return cmd.targets;
        } else if constexpr (std::is_same_v<T, RenameCommand>) {
            return {cmd.target};
        } else if constexpr (std::is_same_v<T, CreateNewCommand>) {
            return {cmd.parent / Utils::utf8_to_path(cmd.name)};
        } else if constexpr (std::is_same_v<T, RestoreCommand>) {
            std::vector<fs::path> paths;
            for (const auto& entry : cmd.entries) {
                paths.push_back(entry.original_path);
            }
            return paths;
        } else {
            std::vector<fs::path> paths;
            for (const auto& move : cmd.moves) {
                paths.push_back(move.first);
            }
            return paths;
        }
    }, command);
}


bool CommandBuilder::is_valid_name(const std::string& name)
{
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}


void CommandBuilder::validate_name(const std::string& name)
{
    if (!is_valid_name(name)) {
        THROW_APP_ERROR(ErrorCodes::Code::INVALID_NAME, name);
    }
}


std::vector<fs::path> CommandBuilder::absolutize_selection(const std::vector<fs::path>& selection)
{
    if (selection.empty()) {
        THROW_APP_ERROR(ErrorCodes::Code::EMPTY_SELECTION, "");
    }
    std::vector<fs::path> result;
    result.reserve(selection.size());
    for (const auto& path : selection) {
        if (path.empty()) {
            THROW_APP_ERROR(ErrorCodes::Code::EMPTY_SELECTION, "blank path in selection");
        }
        result.push_back(Utils::absolutize(path));
    }
    return result;
}


Command CommandBuilder::copy(const std::vector<fs::path>& selection, const fs::path& destination)
{
    if (destination.empty()) {
        THROW_APP_ERROR(ErrorCodes::Code::EMPTY_SELECTION, "no destination");
    }
    return CopyCommand{absolutize_selection(selection), Utils::absolutize(destination)};
}


Command CommandBuilder::move(const std::vector<fs::path>& selection, const fs::path& destination)
{
    if (destination.empty()) {
        THROW_APP_ERROR(ErrorCodes::Code::EMPTY_SELECTION, "no destination");
    }
    return MoveCommand{absolutize_selection(selection), Utils::absolutize(destination)};
}


Command CommandBuilder::remove(const std::vector<fs::path>& selection)
{
    return DeleteCommand{absolutize_selection(selection)};
}


Command CommandBuilder::rename(const fs::path& target, const std::string& new_name)
{
    if (target.empty()) {
        THROW_APP_ERROR(ErrorCodes::Code::EMPTY_SELECTION, "");
    }
    validate_name(new_name);

    const fs::path absolute = Utils::absolutize(target);
    if (Utils::path_to_utf8(absolute.filename()) == new_name) {
        THROW_APP_ERROR(ErrorCodes::Code::NAME_UNCHANGED, new_name);
    }
    const fs::path candidate = absolute.parent_path() / Utils::utf8_to_path(new_name);
    if (Utils::entry_exists(candidate)) {
        THROW_APP_ERROR(ErrorCodes::Code::NAME_COLLISION, Utils::path_to_utf8(candidate));
    }
    return RenameCommand{absolute, new_name};
}


Command CommandBuilder::create(const fs::path& parent, const std::string& name, CreationKind kind)
{
    if (parent.empty()) {
        THROW_APP_ERROR(ErrorCodes::Code::EMPTY_SELECTION, "");
    }
    validate_name(name);

    const fs::path absolute = Utils::absolutize(parent);
    const fs::path candidate = absolute / Utils::utf8_to_path(name);
    if (Utils::entry_exists(candidate)) {
        THROW_APP_ERROR(ErrorCodes::Code::NAME_COLLISION, Utils::path_to_utf8(candidate));
    }
    return CreateNewCommand{absolute, name, kind};
}
