#include <catch2/catch_test_macros.hpp>
#include "OperationWorker.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

// Lets a test hold the worker inside a job until it says go.
class Gate {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_{false};
};

JobResult done_outcome() {
    return Outcome::failed(ErrorCodes::Code::NO_ERROR, "done");
}

}

TEST_CASE("jobs run one at a time in submission order") {
    OperationWorker worker(8);
    std::mutex mutex;
    std::vector<int> order;

    for (int i = 0; i < 5; ++i) {
        REQUIRE(worker.submit("job", [&, i](const std::atomic<bool>&) -> JobResult {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
            return done_outcome();
        }));
    }
    worker.wait_idle();

    const std::vector<int> expected{0, 1, 2, 3, 4};
    CHECK(order == expected);
    const auto completed = worker.poll();
    REQUIRE(completed.size() == 5);
    for (std::size_t i = 1; i < completed.size(); ++i) {
        CHECK(completed[i - 1].id < completed[i].id);
    }
    CHECK(worker.poll().empty());
}

TEST_CASE("a full queue refuses new work") {
    OperationWorker worker(2);
    Gate gate;
    std::atomic<bool> started{false};

    REQUIRE(worker.submit("blocker", [&](const std::atomic<bool>&) -> JobResult {
        started = true;
        gate.wait();
        return done_outcome();
    }));
    while (!started) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    CHECK(worker.submit("q1", [](const std::atomic<bool>&) -> JobResult { return done_outcome(); }));
    CHECK(worker.submit("q2", [](const std::atomic<bool>&) -> JobResult { return done_outcome(); }));
    CHECK_FALSE(worker.submit("q3", [](const std::atomic<bool>&) -> JobResult { return done_outcome(); }));
    CHECK(worker.queued() == 2);
    CHECK(worker.busy());

    gate.open();
    worker.wait_idle();
    CHECK(worker.poll().size() == 3);
    CHECK_FALSE(worker.busy());
}

TEST_CASE("cancel_current raises the running job's flag only") {
    OperationWorker worker(4);
    CHECK_FALSE(worker.cancel_current());

    std::atomic<bool> started{false};
    std::atomic<bool> saw_cancel{false};
    std::atomic<bool> second_saw_cancel{true};

    REQUIRE(worker.submit("long", [&](const std::atomic<bool>& cancel) -> JobResult {
        started = true;
        while (!cancel) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        saw_cancel = true;
        return Outcome::cancelled({});
    }));
    REQUIRE(worker.submit("next", [&](const std::atomic<bool>& cancel) -> JobResult {
        second_saw_cancel = cancel.load();
        return done_outcome();
    }));

    while (!started) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    CHECK(worker.cancel_current());
    worker.wait_idle();

    CHECK(saw_cancel);
    CHECK_FALSE(second_saw_cancel);
    const auto completed = worker.poll();
    REQUIRE(completed.size() == 2);
    const auto* first = std::get_if<Outcome>(&completed[0].result);
    REQUIRE(first != nullptr);
    CHECK(first->status == OutcomeStatus::Cancelled);
}

TEST_CASE("a throwing job becomes a failed outcome and the worker keeps going") {
    OperationWorker worker(4);
    REQUIRE(worker.submit("boom", [](const std::atomic<bool>&) -> JobResult {
        throw std::runtime_error("boom");
    }));
    REQUIRE(worker.submit("after", [](const std::atomic<bool>&) -> JobResult { return done_outcome(); }));
    worker.wait_idle();

    const auto completed = worker.poll();
    REQUIRE(completed.size() == 2);
    const auto* failed = std::get_if<Outcome>(&completed[0].result);
    REQUIRE(failed != nullptr);
    CHECK(failed->status == OutcomeStatus::Failed);
    CHECK(failed->error == ErrorCodes::Code::UNKNOWN_ERROR);
    CHECK(failed->message == "boom");
    CHECK(completed[1].label == "after");
}
