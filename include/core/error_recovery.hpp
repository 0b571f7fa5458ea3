#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include "logging/logger.hpp"

class OperationTimeoutError : public std::runtime_error
{
public:
    explicit OperationTimeoutError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Owner of the worker threads started by ErrorRecovery::callWithTimeout
 *
 * A worker is abandoned once its caller's deadline passes. Abandoned workers
 * keep running until their callable returns; while max_abandoned of them are
 * still running, new calls are refused. waitForIdle() lets the process drain
 * workers before static destruction.
 */
class WorkerRegistry
{
public:
    struct Ticket
    {
        bool abandoned = false;
        bool finished = false;
    };

    explicit WorkerRegistry(size_t max_abandoned = 8) : max_abandoned_(max_abandoned) {}

    WorkerRegistry(const WorkerRegistry &) = delete;
    WorkerRegistry &operator=(const WorkerRegistry &) = delete;

    // nullptr when the abandoned-worker limit is reached
    std::shared_ptr<Ticket> start()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (abandoned_ >= max_abandoned_)
        {
            return nullptr;
        }
        ++running_;
        return std::make_shared<Ticket>();
    }

    void abandon(Ticket &ticket)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ticket.finished && !ticket.abandoned)
        {
            ticket.abandoned = true;
            ++abandoned_;
        }
    }

    void finish(Ticket &ticket)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ticket.finished = true;
            --running_;
            if (ticket.abandoned)
            {
                --abandoned_;
            }
        }
        cv_.notify_all();
    }

    /**
     * @brief Block until no worker is running
     * @return false if workers were still running when the timeout expired
     */
    bool waitForIdle(std::chrono::milliseconds timeout) const
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]
                            { return running_ == 0; });
    }

    size_t running() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    size_t abandoned() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return abandoned_;
    }

    size_t maxAbandoned() const { return max_abandoned_; }

private:
    const size_t max_abandoned_;
    size_t running_ = 0;
    size_t abandoned_ = 0;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

class ErrorRecovery
{
public:
    /**
     * @brief Run a callable with a deadline
     *
     * The callable runs on a worker thread registered with `workers`. If it has
     * not finished when the deadline passes, OperationTimeoutError is thrown and
     * the worker is abandoned: it keeps running to completion but its result is
     * discarded. Everything the callable touches must therefore be owned by the
     * callable itself (captured by value or through shared_ptr).
     *
     * OperationTimeoutError is also thrown, without running the callable, when
     * the registry already holds its limit of abandoned workers.
     *
     * A non-positive timeout runs the callable inline with no deadline.
     */
    template <typename Func>
    static auto callWithTimeout(Func func, std::chrono::milliseconds timeout, const std::string &operation_name,
                                const std::shared_ptr<WorkerRegistry> &workers)
        -> decltype(func())
    {
        using ResultType = decltype(func());

        if (timeout.count() <= 0)
        {
            return func();
        }
        if (!workers)
        {
            throw std::invalid_argument("callWithTimeout requires a worker registry");
        }

        std::shared_ptr<WorkerRegistry::Ticket> ticket = workers->start();
        if (!ticket)
        {
            Logger::error("Operation '" + operation_name + "' refused: " + std::to_string(workers->abandoned()) +
                          " timed-out workers are still running");
            throw OperationTimeoutError("Operation '" + operation_name + "' not started: too many timed-out workers");
        }

        auto task = std::make_shared<std::packaged_task<ResultType()>>(std::move(func));
        std::future<ResultType> future = task->get_future();
        try
        {
            std::thread([task, workers, ticket]() mutable
                        {
                (*task)();
                // Release the callable's captures before reporting completion
                task.reset();
                workers->finish(*ticket); })
                .detach();
        }
        catch (const std::system_error &)
        {
            workers->finish(*ticket);
            throw;
        }

        if (future.wait_for(timeout) == std::future_status::timeout)
        {
            workers->abandon(*ticket);
            Logger::error("Operation '" + operation_name + "' timed out after " +
                          std::to_string(timeout.count()) + "ms");
            throw OperationTimeoutError("Operation '" + operation_name + "' timed out");
        }

        return future.get();
    }
};
