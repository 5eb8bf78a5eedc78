#pragma once
#include <hnmd/task/TaskState.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace HN {

/**
 * Task: one unit of work for the data execution context.
 *
 * Continuous subscriptions and dependency refreshes each run as one Task. The
 * owner keeps the shared_ptr; executors only hold weak references, so dropping
 * the owner's handle abandons a task that has not started yet.
 *
 * Cancellation is cooperative: requestCancel() raises a flag the task body polls
 * through cancelRequested().
 */
struct Task {
    using Function = std::function<void(Task&)>;

    static auto Create(std::string label, Function fun) -> std::shared_ptr<Task>;

    auto isCompleted() const -> bool;
    auto isFailed() const -> bool;
    auto isTerminal() const -> bool;
    auto hasStarted() const -> bool;
    auto tryStart() -> bool;
    auto transitionToRunning() -> bool;
    auto markCompleted() -> void;
    auto markFailed() -> void;
    auto state() const -> TaskState;

    auto requestCancel() -> void;
    auto cancelRequested() const -> bool;

    auto label() const -> std::string const& { return this->label_; }

    // Blocks until the task reaches a terminal state.
    auto wait() const -> void;
    // Returns false if the task was still running at the deadline.
    template <typename Rep, typename Period>
    auto wait_for(std::chrono::duration<Rep, Period> const& d) const -> bool {
        std::unique_lock<std::mutex> lock(this->doneMutex);
        return this->doneCv.wait_for(lock, d, [this] { return this->stateAtomic.isTerminal(); });
    }

private:
    friend class TaskPool;

    Task() = default;
    Task(const Task&)            = delete;
    Task& operator=(const Task&) = delete;
    Task(Task&&)                 = delete;
    Task& operator=(Task&&)      = delete;

    auto notifyDone() -> void;

    TaskStateAtomic                 stateAtomic;
    Function                        function;
    std::string                     label_;
    std::atomic<bool>               cancelled{false};
    mutable std::mutex              doneMutex;
    mutable std::condition_variable doneCv;
};

} // namespace HN
