#ifndef FILE_MANAGER_SESSION_HPP
#define FILE_MANAGER_SESSION_HPP

#include "Command.hpp"
#include "ErrorCode.hpp"
#include "OperationWorker.hpp"
#include "Outcome.hpp"
#include "PrivilegeEscalationManager.hpp"
#include "Types.hpp"

#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class FileOperationEngine;
class UndoStack;
namespace spdlog { class logger; }

struct SessionEvent {
    enum class Kind {
        Applied,
        PartiallyApplied,
        NeedsEscalation,
        EscalationDeclined,
        EscalationFailed,
        Failed,
        Cancelled,
        Undone,
        UndoFailed,
        NothingToUndo
    };

    Kind kind{Kind::Failed};
    std::uint64_t job_id{0};
    std::string message;
    ErrorCodes::Code error{ErrorCodes::Code::NO_ERROR};
    std::vector<TargetFailure> failures;
    std::vector<std::filesystem::path> partial_output;
};

/**
 * @brief What the UI talks to.
 *
 * Commands and undo requests run on the worker in submission order. A job
 * that applies a command records its ExecutedOperation on the undo stack
 * before the next job starts. Permission-denied commands wait here until the
 * user provides a credential or declines; poll() turns finished jobs into
 * status events and is meant to be called once per UI tick.
 */
class FileManagerSession {
public:
    FileManagerSession(FileOperationEngine& engine,
                       UndoStack& undo_stack,
                       PrivilegeEscalationManager& escalation,
                       OperationWorker& worker,
                       EscalationScope scope = EscalationScope::SingleCommand,
                       std::shared_ptr<spdlog::logger> logger = nullptr);

    std::optional<std::uint64_t> submit(Command command);
    std::optional<std::uint64_t> request_undo();
    std::vector<SessionEvent> poll();

    bool escalation_pending() const;
    // Commands the next credential would be used for.
    std::vector<Command> commands_awaiting_escalation() const;

    /**
     * @brief Validates the credential (wiping it) and queues the elevated retry.
     * @return nullopt when the retry was queued; otherwise why it was not.
     * On InvalidCredential or BackendUnavailable the waiting commands are dropped.
     */
    std::optional<AuthError> provide_credential(std::string& credential);
    void decline_escalation();

    bool cancel_current();
    std::size_t undo_depth() const;

    EscalationScope get_escalation_scope() const;
    void set_escalation_scope(EscalationScope scope);

private:
    std::vector<Command> take_escalation_batch();
    void emit(SessionEvent event);
    void translate(CompletedJob& job, std::vector<SessionEvent>& events);
    void translate_outcome(std::uint64_t job_id, const std::string& label, Outcome& outcome,
                           std::vector<SessionEvent>& events);
    void translate_undo(std::uint64_t job_id, UndoResult& result, std::vector<SessionEvent>& events);

    FileOperationEngine& engine;
    UndoStack& undo_stack;
    PrivilegeEscalationManager& escalation;
    OperationWorker& worker;
    EscalationScope scope;
    std::shared_ptr<spdlog::logger> logger;

    std::deque<Command> awaiting_escalation;
    std::vector<SessionEvent> local_events;
};

#endif
