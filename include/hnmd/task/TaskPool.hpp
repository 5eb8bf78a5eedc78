#pragma once
#include <hnmd/core/Error.hpp>
#include <hnmd/task/Executor.hpp>
#include <hnmd/task/Task.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace HN {

// Fixed-size worker pool; the data execution context of a DocumentRuntime.
class TaskPool : public Executor {
public:
    explicit TaskPool(std::size_t threadCount = std::thread::hardware_concurrency());
    ~TaskPool() override;

    TaskPool(TaskPool const&)                    = delete;
    auto operator=(TaskPool const&) -> TaskPool& = delete;

    using Executor::submit;
    auto submit(std::weak_ptr<Task>&& task) -> std::optional<Error> override;
    auto shutdown() -> void override;
    auto size() const -> std::size_t override;

    [[nodiscard]] auto activeTaskCount() const -> std::size_t { return this->activeTasks.load(); }

private:
    auto workerFunction() -> void;

    std::vector<std::jthread>       workers;
    std::queue<std::weak_ptr<Task>> tasks;
    mutable std::mutex              mutex;
    std::condition_variable         taskCV;
    bool                            shuttingDown = false;
    std::atomic<std::size_t>        activeTasks{0};
};

} // namespace HN
