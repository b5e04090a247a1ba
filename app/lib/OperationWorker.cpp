#include "OperationWorker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

OperationWorker::OperationWorker(std::size_t capacity, std::shared_ptr<spdlog::logger> logger)
    : max_queued(std::max<std::size_t>(capacity, 1)),
      logger(std::move(logger))
{
    thread = std::thread([this]() { run(); });
}


OperationWorker::~OperationWorker()
{
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopping = true;
        dropped = queue.size();
        queue.clear();
    }
    cancel_flag = true;
    wake.notify_all();
    if (thread.joinable()) {
        thread.join();
    }
    if (dropped > 0 && logger) {
        logger->warn("Worker stopped with {} queued operation(s) not started", dropped);
    }
}


std::optional<std::uint64_t> OperationWorker::submit(std::string label, Job job)
{
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopping || queue.size() >= max_queued) {
            if (logger) {
                logger->warn("Worker queue full ({}); refused '{}'", max_queued, label);
            }
            return std::nullopt;
        }
        id = next_id++;
        queue.push_back(QueuedJob{id, std::move(label), std::move(job)});
    }
    wake.notify_one();
    return id;
}


std::vector<CompletedJob> OperationWorker::poll()
{
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<CompletedJob> drained;
    drained.swap(finished);
    return drained;
}


bool OperationWorker::cancel_current()
{
    std::lock_guard<std::mutex> lock(mutex);
    if (!running) {
        return false;
    }
    cancel_flag = true;
    return true;
}


void OperationWorker::wait_idle()
{
    std::unique_lock<std::mutex> lock(mutex);
    idle.wait(lock, [this]() { return stopping || (queue.empty() && !running); });
}


std::size_t OperationWorker::queued() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return queue.size();
}


bool OperationWorker::busy() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return running || !queue.empty();
}


JobResult OperationWorker::execute(QueuedJob& job)
{
    try {
        return job.job(cancel_flag);
    } catch (const std::exception& ex) {
        if (logger) {
            logger->error("Operation '{}' threw: {}", job.label, ex.what());
        }
        return Outcome::failed(ErrorCodes::Code::UNKNOWN_ERROR, ex.what());
    }
}


void OperationWorker::run()
{
    for (;;) {
        QueuedJob job;
        {
            std::unique_lock<std::mutex> lock(mutex);
            wake.wait(lock, [this]() { return stopping || !queue.empty(); });
            if (stopping) {
                break;
            }
            job = std::move(queue.front());
            queue.pop_front();
            running = true;
            cancel_flag = false;
        }

        if (logger) {
            logger->debug("Worker started #{} '{}'", job.id, job.label);
        }
        JobResult result = execute(job);

        {
            std::lock_guard<std::mutex> lock(mutex);
            finished.push_back(CompletedJob{job.id, std::move(job.label), std::move(result)});
            running = false;
        }
        idle.notify_all();
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        running = false;
    }
    idle.notify_all();
}
