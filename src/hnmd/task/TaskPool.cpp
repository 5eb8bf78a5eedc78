#include <hnmd/task/TaskPool.hpp>

#include <hnmd/log/TaggedLogger.hpp>

#include <exception>

namespace HN {

TaskPool::TaskPool(std::size_t threadCount) {
    if (threadCount == 0)
        threadCount = 1;
    hn_log("TaskPool::TaskPool spawning " + std::to_string(threadCount) + " workers", "TaskPool");
    this->workers.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i)
        this->workers.emplace_back(&TaskPool::workerFunction, this);
}

TaskPool::~TaskPool() {
    hn_log("TaskPool::~TaskPool", "TaskPool");
    this->shutdown();
}

auto TaskPool::submit(std::weak_ptr<Task>&& task) -> std::optional<Error> {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->shuttingDown) {
            hn_log("TaskPool::submit refused: shutting down", "TaskPool");
            return Error{Error::Code::Cancelled, "Executor shutting down"};
        }
        auto locked = task.lock();
        if (!locked) {
            hn_log("TaskPool::submit task expired before enqueue", "TaskPool");
            return Error{Error::Code::InvalidState, "Task expired before enqueue"};
        }
        if (!locked->tryStart()) {
            hn_log("TaskPool::submit task '" + locked->label() + "' already started", "TaskPool");
            return Error{Error::Code::InvalidState, "Task '" + locked->label() + "' was already submitted"};
        }
        this->tasks.push(std::move(task));
    }
    this->taskCV.notify_one();
    return std::nullopt;
}

auto TaskPool::shutdown() -> void {
    std::queue<std::weak_ptr<Task>> abandoned;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (!this->shuttingDown) {
            hn_log("TaskPool::shutdown begin", "TaskPool");
            this->shuttingDown = true;
            std::swap(abandoned, this->tasks);
        }
    }
    this->taskCV.notify_all();

    while (!abandoned.empty()) {
        if (auto task = abandoned.front().lock()) {
            hn_log("TaskPool::shutdown abandoning task '" + task->label() + "'", "TaskPool");
            task->markFailed();
        }
        abandoned.pop();
    }

    for (auto& worker : this->workers) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id())
            worker.join();
    }
}

auto TaskPool::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->shuttingDown ? 0 : this->workers.size();
}

auto TaskPool::workerFunction() -> void {
    while (true) {
        std::weak_ptr<Task> task;
        {
            std::unique_lock<std::mutex> lock(this->mutex);
            this->taskCV.wait(lock, [this] { return this->shuttingDown || !this->tasks.empty(); });
            if (this->tasks.empty())
                break;
            task = std::move(this->tasks.front());
            this->tasks.pop();
        }

        auto strongTask = task.lock();
        if (!strongTask) {
            hn_log("TaskPool::workerFunction task dropped by its owner before running", "TaskPool");
            continue;
        }

        ++this->activeTasks;
        strongTask->transitionToRunning();
        try {
            strongTask->function(*strongTask);
            strongTask->markCompleted();
        } catch (std::exception const& ex) {
            hn_log("Task '" + strongTask->label() + "' threw: " + ex.what(), "TaskPool", "Error");
            strongTask->markFailed();
        }
        --this->activeTasks;
    }
    hn_log("TaskPool::workerFunction exit", "TaskPool");
}

} // namespace HN
