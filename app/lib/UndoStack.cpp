#include "UndoStack.hpp"

#include "FileOperationEngine.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

#include "ErrorMessages.hpp"

UndoStack::UndoStack(FileOperationEngine& engine, std::size_t limit, std::shared_ptr<spdlog::logger> logger)
    : engine(engine),
      logger(std::move(logger)),
      max_depth(std::max<std::size_t>(limit, 1))
{
}


void UndoStack::record(ExecutedOperation operation)
{
    if (!is_undoable(operation)) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex);
    push_locked(std::move(operation));
}


void UndoStack::push_locked(ExecutedOperation operation)
{
    entries.push_back(std::move(operation));
    while (entries.size() > max_depth) {
        if (logger) {
            logger->debug("Undo history full; forgetting '{}'", describe(entries.front()));
        }
        entries.pop_front();
    }
}


std::optional<ExecutedOperation> UndoStack::pop()
{
    std::lock_guard<std::mutex> lock(mutex);
    if (entries.empty()) {
        return std::nullopt;
    }
    ExecutedOperation top = std::move(entries.back());
    entries.pop_back();
    return top;
}


UndoResult UndoStack::undo()
{
    UndoResult result;
    std::optional<ExecutedOperation> entry = pop();
    if (!entry) {
        result.status = UndoResult::Status::NothingToUndo;
        result.error = ErrorCodes::Code::NOTHING_TO_UNDO;
        result.message = ErrorMessages::get_message_for_code(ErrorCodes::Code::NOTHING_TO_UNDO);
        return result;
    }

    result.description = describe(*entry);
    const std::optional<Command> inverse = inverse_of(*entry);
    if (!inverse) {
        result.status = UndoResult::Status::Failed;
        result.error = ErrorCodes::Code::UNKNOWN_ERROR;
        result.message = "operation has no inverse";
        return result;
    }

    Outcome outcome = engine.apply(*inverse);

    if (outcome.status == OutcomeStatus::Success && outcome.failures.empty()) {
        result.status = UndoResult::Status::Undone;
        if (logger) {
            logger->info("Undid '{}'", result.description);
        }
        return result;
    }

    // Whatever was not reversed goes back on top.
    std::optional<ExecutedOperation> remainder = *entry;
    if (outcome.executed) {
        remainder = remainder_after_undo(*entry, *outcome.executed);
    }
    if (remainder) {
        std::lock_guard<std::mutex> lock(mutex);
        push_locked(std::move(*remainder));
        result.requeued = true;
    }

    result.status = UndoResult::Status::Failed;
    result.failures = std::move(outcome.failures);
    if (outcome.status == OutcomeStatus::Success) {
        result.error = result.failures.front().code;
        result.message = fmt::format("{} of {} item(s) could not be reversed; first: {}",
                                     result.failures.size(), target_count(*inverse), result.failures.front().detail);
    } else {
        result.error = outcome.error;
        result.message = outcome.message;
    }

    if (logger) {
        logger->warn("Undo of '{}' failed with {}: {}{}", result.description,
                     ErrorCodes::ErrorCatalog::code_name(result.error), result.message,
                     result.requeued ? " (kept on the undo stack)" : "");
    }
    return result;
}


std::size_t UndoStack::depth() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
}


std::optional<std::string> UndoStack::peek_description() const
{
    std::lock_guard<std::mutex> lock(mutex);
    if (entries.empty()) {
        return std::nullopt;
    }
    return describe(entries.back());
}


void UndoStack::clear()
{
    std::lock_guard<std::mutex> lock(mutex);
    entries.clear();
}


std::size_t UndoStack::limit() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return max_depth;
}


void UndoStack::set_limit(std::size_t limit)
{
    std::lock_guard<std::mutex> lock(mutex);
    max_depth = std::max<std::size_t>(limit, 1);
    while (entries.size() > max_depth) {
        entries.pop_front();
    }
}
