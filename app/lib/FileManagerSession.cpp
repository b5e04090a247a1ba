#include "FileManagerSession.hpp"

#include "FileOperationEngine.hpp"
#include "UndoStack.hpp"
#include "Utils.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <type_traits>

#include "ErrorMessages.hpp"

namespace {

void record_applied(UndoStack& undo_stack, const Outcome& outcome)
{
    if (outcome.executed && (outcome.status == OutcomeStatus::Success
                             || outcome.status == OutcomeStatus::PermissionDenied)) {
        undo_stack.record(*outcome.executed);
    }
}

std::string join_paths(const std::vector<std::filesystem::path>& paths)
{
    std::string joined;
    for (const auto& path : paths) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += Utils::path_to_utf8(path);
    }
    return joined;
}

}


FileManagerSession::FileManagerSession(FileOperationEngine& engine,
                                       UndoStack& undo_stack,
                                       PrivilegeEscalationManager& escalation,
                                       OperationWorker& worker,
                                       EscalationScope scope,
                                       std::shared_ptr<spdlog::logger> logger)
    : engine(engine),
      undo_stack(undo_stack),
      escalation(escalation),
      worker(worker),
      scope(scope),
      logger(std::move(logger))
{
}


EscalationScope FileManagerSession::get_escalation_scope() const
{
    return scope;
}


void FileManagerSession::set_escalation_scope(EscalationScope value)
{
    scope = value;
}


void FileManagerSession::emit(SessionEvent event)
{
    local_events.push_back(std::move(event));
}


std::optional<std::uint64_t> FileManagerSession::submit(Command command)
{
    std::string label = describe(command);
    auto id = worker.submit(label, [&engine = engine, &undo_stack = undo_stack, command = std::move(command)]
                                   (const std::atomic<bool>& cancel_requested) -> JobResult {
        ApplyContext context;
        context.cancel_flag = &cancel_requested;
        Outcome outcome = engine.apply(command, context);
        record_applied(undo_stack, outcome);
        return outcome;
    });

    if (!id) {
        emit({SessionEvent::Kind::Failed, 0, MSG_QUEUE_FULL, ErrorCodes::Code::NO_ERROR, {}, {}});
    } else if (logger) {
        logger->debug("Queued #{} '{}'", *id, label);
    }
    return id;
}


std::optional<std::uint64_t> FileManagerSession::request_undo()
{
    auto id = worker.submit("undo", [&undo_stack = undo_stack](const std::atomic<bool>&) -> JobResult {
        return undo_stack.undo();
    });
    if (!id) {
        emit({SessionEvent::Kind::UndoFailed, 0, MSG_QUEUE_FULL, ErrorCodes::Code::NO_ERROR, {}, {}});
    }
    return id;
}


bool FileManagerSession::escalation_pending() const
{
    return !awaiting_escalation.empty();
}


std::vector<Command> FileManagerSession::commands_awaiting_escalation() const
{
    if (awaiting_escalation.empty()) {
        return {};
    }
    if (scope == EscalationScope::SingleCommand) {
        return {awaiting_escalation.front()};
    }
    return {awaiting_escalation.begin(), awaiting_escalation.end()};
}


std::vector<Command> FileManagerSession::take_escalation_batch()
{
    std::vector<Command> batch = commands_awaiting_escalation();
    if (scope == EscalationScope::SingleCommand) {
        awaiting_escalation.pop_front();
    } else {
        awaiting_escalation.clear();
    }
    return batch;
}


std::optional<AuthError> FileManagerSession::provide_credential(std::string& credential)
{
    if (awaiting_escalation.empty()) {
        Utils::wipe_string(credential);
        return std::nullopt;
    }

    EscalationResult result = escalation.escalate(credential);
    if (!result.ok()) {
        const AuthError error = result.error.value_or(AuthError::InvalidCredential);
        const ErrorCodes::Code code = to_error_code(error);
        std::string message = ErrorCodes::ErrorCatalog::get_error_info(code).get_user_message();
        if (error != AuthError::SessionInUse) {
            // The commands that asked for the credential are dropped, never applied or recorded.
            const std::vector<Command> dropped = take_escalation_batch();
            for (const auto& command : dropped) {
                if (logger) {
                    logger->warn("Dropping '{}' after failed escalation ({})", describe(command), to_string(error));
                }
            }
        }
        emit({SessionEvent::Kind::EscalationFailed, 0, std::move(message), code, {}, {}});
        return error;
    }

    std::vector<Command> batch = take_escalation_batch();
    auto session = std::make_shared<CredentialSession>(std::move(*result.session));
    const std::string label = batch.size() == 1 ? describe(batch.front()) + " [elevated]"
                                                : fmt::format("{} elevated operations", batch.size());

    auto id = worker.submit(label, [&escalation = escalation, &undo_stack = undo_stack, batch, session]
                                   (const std::atomic<bool>& cancel_requested) -> JobResult {
        ApplyContext context;
        context.cancel_flag = &cancel_requested;
        EscalatedRun run;
        run.commands = batch;
        if (batch.size() == 1) {
            run.outcomes.push_back(escalation.retry_with_escalation(batch.front(), std::move(*session), context));
        } else {
            run.outcomes = escalation.retry_batch_with_escalation(batch, std::move(*session), context);
        }
        for (const auto& outcome : run.outcomes) {
            record_applied(undo_stack, outcome);
        }
        return run;
    });

    if (!id) {
        // The unused session ends with the last reference; keep the commands for another try.
        for (auto it = batch.rbegin(); it != batch.rend(); ++it) {
            awaiting_escalation.push_front(std::move(*it));
        }
        emit({SessionEvent::Kind::Failed, 0, MSG_QUEUE_FULL, ErrorCodes::Code::NO_ERROR, {}, {}});
    }
    return std::nullopt;
}


void FileManagerSession::decline_escalation()
{
    if (awaiting_escalation.empty()) {
        return;
    }
    for (const auto& command : take_escalation_batch()) {
        emit({SessionEvent::Kind::EscalationDeclined, 0,
              fmt::format(fmt::runtime(MSG_ESCALATION_DECLINED), describe(command)),
              ErrorCodes::Code::PERMISSION_DENIED, {}, {}});
    }
}


bool FileManagerSession::cancel_current()
{
    return worker.cancel_current();
}


std::size_t FileManagerSession::undo_depth() const
{
    return undo_stack.depth();
}


std::vector<SessionEvent> FileManagerSession::poll()
{
    std::vector<SessionEvent> events;
    events.swap(local_events);
    for (auto& job : worker.poll()) {
        translate(job, events);
    }
    return events;
}


void FileManagerSession::translate(CompletedJob& job, std::vector<SessionEvent>& events)
{
    std::visit([&](auto& result) {
        using T = std::decay_t<decltype(result)>;
        if constexpr (std::is_same_v<T, Outcome>) {
            translate_outcome(job.id, job.label, result, events);
        } else if constexpr (std::is_same_v<T, UndoResult>) {
            translate_undo(job.id, result, events);
        } else {
            for (std::size_t i = 0; i < result.outcomes.size(); ++i) {
                const std::string label = i < result.commands.size() ? describe(result.commands[i]) : job.label;
                translate_outcome(job.id, label, result.outcomes[i], events);
            }
        }
    }, job.result);
}


void FileManagerSession::translate_outcome(std::uint64_t job_id, const std::string& label, Outcome& outcome,
                                           std::vector<SessionEvent>& events)
{
    SessionEvent event;
    event.job_id = job_id;
    event.error = outcome.error;
    event.failures = std::move(outcome.failures);

    switch (outcome.status) {
        case OutcomeStatus::Success:
            if (event.failures.empty()) {
                event.kind = SessionEvent::Kind::Applied;
                event.message = fmt::format(fmt::runtime(MSG_APPLIED), label);
            } else {
                event.kind = SessionEvent::Kind::PartiallyApplied;
                event.message = fmt::format(fmt::runtime(MSG_PARTIAL), label, event.failures.size());
            }
            break;
        case OutcomeStatus::PermissionDenied: {
            event.kind = SessionEvent::Kind::NeedsEscalation;
            const std::string what = outcome.pending ? describe(*outcome.pending) : label;
            event.message = fmt::format(fmt::runtime(MSG_NEEDS_ESCALATION), what);
            if (outcome.pending) {
                awaiting_escalation.push_back(std::move(*outcome.pending));
            }
            break;
        }
        case OutcomeStatus::Failed:
            event.kind = SessionEvent::Kind::Failed;
            event.message = fmt::format(fmt::runtime(MSG_FAILED), label, outcome.message);
            break;
        case OutcomeStatus::Cancelled:
            event.kind = SessionEvent::Kind::Cancelled;
            event.partial_output = std::move(outcome.partial_output);
            event.message = fmt::format(fmt::runtime(MSG_CANCELLED), label, event.partial_output.size());
            if (logger && !event.partial_output.empty()) {
                logger->warn("'{}' cancelled; left in place: {}", label, join_paths(event.partial_output));
            }
            break;
    }
    events.push_back(std::move(event));
}


void FileManagerSession::translate_undo(std::uint64_t job_id, UndoResult& result, std::vector<SessionEvent>& events)
{
    SessionEvent event;
    event.job_id = job_id;
    event.error = result.error;
    event.failures = std::move(result.failures);

    switch (result.status) {
        case UndoResult::Status::Undone:
            event.kind = SessionEvent::Kind::Undone;
            event.message = fmt::format(fmt::runtime(MSG_UNDONE), result.description);
            break;
        case UndoResult::Status::NothingToUndo:
            event.kind = SessionEvent::Kind::NothingToUndo;
            event.message = result.message;
            break;
        case UndoResult::Status::Failed:
            event.kind = SessionEvent::Kind::UndoFailed;
            event.message = fmt::format(fmt::runtime(MSG_UNDO_FAILED), result.message);
            break;
    }
    events.push_back(std::move(event));
}
