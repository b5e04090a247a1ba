#ifndef OUTCOME_HPP
#define OUTCOME_HPP

#include "Command.hpp"
#include "ErrorCode.hpp"
#include "ExecutedOperation.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

enum class OutcomeStatus {Success, PermissionDenied, Failed, Cancelled};

inline std::string to_string(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Success: return "Success";
        case OutcomeStatus::PermissionDenied: return "PermissionDenied";
        case OutcomeStatus::Failed: return "Failed";
        case OutcomeStatus::Cancelled: return "Cancelled";
        default: return "Unknown";
    }
}

// One target of a batch that did not go through.
struct TargetFailure {
    std::filesystem::path path;
    ErrorCodes::Code code{ErrorCodes::Code::UNKNOWN_ERROR};
    std::string detail;
};

/**
 * @brief Result of applying one command.
 *
 * - Success: `executed` holds the applied part; `failures` lists targets that did not make it.
 * - PermissionDenied: `pending` is the command (narrowed to the unfinished targets) to retry
 *   elevated. Targets that already completed are in `executed`.
 * - Failed: nothing was applied; `error` and `message` say why.
 * - Cancelled: stopped between entries; `partial_output` lists what was left behind.
 */
struct Outcome {
    OutcomeStatus status{OutcomeStatus::Failed};
    std::optional<ExecutedOperation> executed;
    std::optional<Command> pending;
    ErrorCodes::Code error{ErrorCodes::Code::NO_ERROR};
    std::string message;
    std::vector<TargetFailure> failures;
    std::vector<std::filesystem::path> partial_output;

    bool is_success() const { return status == OutcomeStatus::Success; }
    bool is_partial() const { return status == OutcomeStatus::Success && !failures.empty(); }

    static Outcome success(ExecutedOperation executed, std::vector<TargetFailure> failures = {}) {
        Outcome outcome;
        outcome.status = OutcomeStatus::Success;
        outcome.executed = std::move(executed);
        outcome.failures = std::move(failures);
        return outcome;
    }

    static Outcome permission_denied(Command pending, std::string message,
                                     std::optional<ExecutedOperation> done = std::nullopt,
                                     std::vector<TargetFailure> failures = {}) {
        Outcome outcome;
        outcome.status = OutcomeStatus::PermissionDenied;
        outcome.pending = std::move(pending);
        outcome.executed = std::move(done);
        outcome.error = ErrorCodes::Code::PERMISSION_DENIED;
        outcome.message = std::move(message);
        outcome.failures = std::move(failures);
        return outcome;
    }

    static Outcome failed(ErrorCodes::Code code, std::string message,
                          std::vector<TargetFailure> failures = {}) {
        Outcome outcome;
        outcome.status = OutcomeStatus::Failed;
        outcome.error = code;
        outcome.message = std::move(message);
        outcome.failures = std::move(failures);
        return outcome;
    }

    static Outcome cancelled(std::vector<std::filesystem::path> partial_output) {
        Outcome outcome;
        outcome.status = OutcomeStatus::Cancelled;
        outcome.error = ErrorCodes::Code::OPERATION_CANCELLED;
        outcome.partial_output = std::move(partial_output);
        return outcome;
    }
};

#endif
