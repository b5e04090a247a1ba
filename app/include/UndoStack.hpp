#ifndef UNDO_STACK_HPP
#define UNDO_STACK_HPP

#include "ErrorCode.hpp"
#include "ExecutedOperation.hpp"
#include "Outcome.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class FileOperationEngine;
namespace spdlog { class logger; }

struct UndoResult {
    enum class Status {Undone, NothingToUndo, Failed};

    Status status{Status::NothingToUndo};
    std::string description;
    ErrorCodes::Code error{ErrorCodes::Code::NO_ERROR};
    std::string message;
    std::vector<TargetFailure> failures;
    // Set when an un-inverted part went back on the stack.
    bool requeued{false};

    bool succeeded() const { return status == Status::Undone; }
};

/**
 * @brief In-memory LIFO of applied operations. No redo, nothing persisted.
 *
 * undo() applies the inverse through the engine with the rights of the
 * current process only; an inverse that needs elevation fails the undo and
 * the entry goes back on the stack unchanged. When only part of an inverse
 * applies, the part that was reversed stays reversed and the rest is pushed
 * back.
 */
class UndoStack {
public:
    explicit UndoStack(FileOperationEngine& engine,
                       std::size_t limit = 256,
                       std::shared_ptr<spdlog::logger> logger = nullptr);

    // Operations without an inverse are ignored.
    void record(ExecutedOperation operation);
    UndoResult undo();

    std::size_t depth() const;
    std::optional<std::string> peek_description() const;
    void clear();

    std::size_t limit() const;
    void set_limit(std::size_t limit);

private:
    void push_locked(ExecutedOperation operation);
    std::optional<ExecutedOperation> pop();

    FileOperationEngine& engine;
    std::shared_ptr<spdlog::logger> logger;
    mutable std::mutex mutex;
    std::deque<ExecutedOperation> entries;
    std::size_t max_depth;
};

#endif
