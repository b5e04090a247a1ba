#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>

namespace ErrorCodes {

// Numbered so the status line and logs can quote a stable code.
enum class Code {
    NO_ERROR = 0,

    // Validation (2000-2099): rejected before any mutation
    EMPTY_SELECTION = 2000,
    PATH_NOT_FOUND = 2001,
    NOT_A_DIRECTORY = 2002,
    INVALID_NAME = 2003,
    NAME_COLLISION = 2004,
    NAME_UNCHANGED = 2005,
    INTO_ITSELF = 2006,
    ALREADY_IN_DESTINATION = 2007,
    DESTINATION_EXISTS = 2008,
    TRASH_SELF_DELETE = 2009,

    // Permission (2100-2199)
    PERMISSION_DENIED = 2100,

    // Authentication (2200-2299)
    AUTH_INVALID_CREDENTIAL = 2200,
    AUTH_BACKEND_UNAVAILABLE = 2201,
    AUTH_SESSION_IN_USE = 2202,
    AUTH_SESSION_EXPIRED = 2203,

    // Trash (2300-2399)
    RESTORE_CONFLICT = 2300,
    TRASH_ENTRY_MISSING = 2301,
    TRASH_UNAVAILABLE = 2302,

    // Device level (2400-2499)
    IO_ERROR = 2400,
    OPERATION_CANCELLED = 2401,

    // Undo (2500-2599)
    NOTHING_TO_UNDO = 2500,

    // Configuration (2600-2699)
    CONFIG_INVALID = 2600,

    UNKNOWN_ERROR = 9999
};

inline bool is_validation_error(Code code) {
    const int value = static_cast<int>(code);
    return value >= 2000 && value < 2100;
}

struct ErrorInfo {
    Code code{Code::NO_ERROR};
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo() = default;
    ErrorInfo(Code code, std::string message, std::string resolution, std::string context = {})
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          context(std::move(context)) {}

    // Message plus what the user can do about it
    std::string get_user_message() const;

    // Everything, including the numeric code and technical context
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
    static std::string code_name(Code code);
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
