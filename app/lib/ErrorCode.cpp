#include "ErrorCode.hpp"

#include <sstream>
#include <unordered_map>

namespace ErrorCodes {

namespace {

struct CatalogEntry {
    const char* name;
    const char* message;
    const char* resolution;
};

const std::unordered_map<Code, CatalogEntry>& catalog()
{
    static const std::unordered_map<Code, CatalogEntry> entries = {
        {Code::NO_ERROR, {"NO_ERROR", "No error.", ""}},
        {Code::EMPTY_SELECTION, {"EMPTY_SELECTION",
            "Nothing is selected for this action.",
            "Select at least one entry and try again."}},
        {Code::PATH_NOT_FOUND, {"PATH_NOT_FOUND",
            "The path no longer exists.",
            "Refresh the listing; the entry may have been moved or removed by another program."}},
        {Code::NOT_A_DIRECTORY, {"NOT_A_DIRECTORY",
            "The destination is not a directory.",
            "Paste into a directory."}},
        {Code::INVALID_NAME, {"INVALID_NAME",
            "The name is not valid.",
            "Use a non-empty name without '/' that is not '.' or '..'."}},
        {Code::NAME_COLLISION, {"NAME_COLLISION",
            "An entry with that name already exists.",
            "Choose a different name."}},
        {Code::NAME_UNCHANGED, {"NAME_UNCHANGED",
            "The name is unchanged.",
            "Enter a different name or cancel the rename."}},
        {Code::INTO_ITSELF, {"INTO_ITSELF",
            "A directory cannot be copied or moved into itself.",
            "Choose a destination outside the selected directory."}},
        {Code::ALREADY_IN_DESTINATION, {"ALREADY_IN_DESTINATION",
            "The entry is already in the destination directory.",
            "Paste into a different directory."}},
        {Code::DESTINATION_EXISTS, {"DESTINATION_EXISTS",
            "The destination already contains an entry with that name.",
            "Rename or remove the existing entry, or set PasteCollision = rename under [Operations]."}},
        {Code::TRASH_SELF_DELETE, {"TRASH_SELF_DELETE",
            "Entries inside the trash cannot be deleted again.",
            "Clean up the trash directory manually."}},
        {Code::PERMISSION_DENIED, {"PERMISSION_DENIED",
            "Permission denied.",
            "Provide your sudo password to retry with elevated rights."}},
        {Code::AUTH_INVALID_CREDENTIAL, {"AUTH_INVALID_CREDENTIAL",
            "Incorrect sudo password.",
            "The operation was not applied. Retry it and enter the correct password."}},
        {Code::AUTH_BACKEND_UNAVAILABLE, {"AUTH_BACKEND_UNAVAILABLE",
            "Could not run sudo.",
            "Check that sudo is installed and that SudoPath under [Escalation] points to it."}},
        {Code::AUTH_SESSION_IN_USE, {"AUTH_SESSION_IN_USE",
            "Another elevated operation is in progress.",
            "Wait for it to finish before escalating again."}},
        {Code::AUTH_SESSION_EXPIRED, {"AUTH_SESSION_EXPIRED",
            "The elevated session is no longer active.",
            "Enter your password again."}},
        {Code::RESTORE_CONFLICT, {"RESTORE_CONFLICT",
            "Another entry now occupies the original location.",
            "The deleted entry stays in the trash; move the new entry away or recover it manually."}},
        {Code::TRASH_ENTRY_MISSING, {"TRASH_ENTRY_MISSING",
            "The entry is no longer in the trash.",
            "It was removed from the trash directory outside of this program."}},
        {Code::TRASH_UNAVAILABLE, {"TRASH_UNAVAILABLE",
            "The trash directory could not be created.",
            "Check TrashDir under [Paths] and the permissions of its parent directory."}},
        {Code::IO_ERROR, {"IO_ERROR",
            "The operation failed.",
            "See the details; the operation was not recorded and will not be retried."}},
        {Code::OPERATION_CANCELLED, {"OPERATION_CANCELLED",
            "The operation was cancelled.",
            "Partial output was left in place and cannot be undone; remove it manually if needed."}},
        {Code::NOTHING_TO_UNDO, {"NOTHING_TO_UNDO",
            "Nothing to undo.",
            ""}},
        {Code::CONFIG_INVALID, {"CONFIG_INVALID",
            "The configuration contains an invalid value.",
            "Fix the value in config.ini; the default is used meanwhile."}},
        {Code::UNKNOWN_ERROR, {"UNKNOWN_ERROR",
            "An unexpected error occurred.",
            "Check the log file for details."}},
    };
    return entries;
}

} // namespace

std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return message + " " + resolution;
}

std::string ErrorInfo::get_full_details() const
{
    std::ostringstream oss;
    oss << "Error " << static_cast<int>(code) << " (" << ErrorCatalog::code_name(code) << "): "
        << message;
    if (!context.empty()) {
        oss << "\nDetails: " << context;
    }
    if (!resolution.empty()) {
        oss << "\nResolution: " << resolution;
    }
    return oss.str();
}

ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    const auto& entries = catalog();
    auto it = entries.find(code);
    if (it == entries.end()) {
        it = entries.find(Code::UNKNOWN_ERROR);
    }
    return ErrorInfo(code, it->second.message, it->second.resolution, context);
}

std::string ErrorCatalog::code_name(Code code)
{
    const auto& entries = catalog();
    const auto it = entries.find(code);
    return it != entries.end() ? it->second.name : "UNKNOWN_ERROR";
}

} // namespace ErrorCodes
