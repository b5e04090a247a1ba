#ifndef OPERATION_WORKER_HPP
#define OPERATION_WORKER_HPP

#include "Command.hpp"
#include "Outcome.hpp"
#include "UndoStack.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace spdlog { class logger; }

// Elevated retries unlocked by one credential; one outcome per command.
struct EscalatedRun {
    std::vector<Command> commands;
    std::vector<Outcome> outcomes;
};

using JobResult = std::variant<Outcome, UndoResult, EscalatedRun>;

struct CompletedJob {
    std::uint64_t id{0};
    std::string label;
    JobResult result;
};

/**
 * @brief One background thread running jobs strictly in submission order.
 *
 * The queue is bounded; submit() refuses work when it is full. Finished jobs
 * wait in a result channel until the interactive thread drains it with poll().
 */
class OperationWorker {
public:
    using Job = std::function<JobResult(const std::atomic<bool>& cancel_requested)>;

    explicit OperationWorker(std::size_t capacity = 32, std::shared_ptr<spdlog::logger> logger = nullptr);
    ~OperationWorker();

    OperationWorker(const OperationWorker&) = delete;
    OperationWorker& operator=(const OperationWorker&) = delete;

    std::optional<std::uint64_t> submit(std::string label, Job job);
    std::vector<CompletedJob> poll();

    // Raises the running job's cancel flag. Returns false when nothing is running.
    bool cancel_current();

    // Blocks until the queue is empty and nothing is running.
    void wait_idle();

    std::size_t queued() const;
    bool busy() const;
    std::size_t capacity() const { return max_queued; }

private:
    struct QueuedJob {
        std::uint64_t id{0};
        std::string label;
        Job job;
    };

    void run();
    JobResult execute(QueuedJob& job);

    const std::size_t max_queued;
    std::shared_ptr<spdlog::logger> logger;

    mutable std::mutex mutex;
    std::condition_variable wake;
    std::condition_variable idle;
    std::deque<QueuedJob> queue;
    std::vector<CompletedJob> finished;
    std::atomic<bool> cancel_flag{false};
    bool running{false};
    bool stopping{false};
    std::uint64_t next_id{1};

    std::thread thread;
};

#endif
