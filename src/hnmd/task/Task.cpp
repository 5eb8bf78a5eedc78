#include <hnmd/task/Task.hpp>

namespace HN {

auto Task::Create(std::string label, Function fun) -> std::shared_ptr<Task> {
    auto task      = std::shared_ptr<Task>(new Task());
    task->label_   = std::move(label);
    task->function = std::move(fun);
    return task;
}

auto Task::isCompleted() const -> bool {
    return this->stateAtomic.isCompleted();
}

auto Task::isFailed() const -> bool {
    return this->stateAtomic.isFailed();
}

auto Task::isTerminal() const -> bool {
    return this->stateAtomic.isTerminal();
}

auto Task::hasStarted() const -> bool {
    return this->stateAtomic.hasStarted();
}

auto Task::tryStart() -> bool {
    return this->stateAtomic.tryStart();
}

auto Task::transitionToRunning() -> bool {
    return this->stateAtomic.transitionToRunning();
}

auto Task::markCompleted() -> void {
    if (this->stateAtomic.markCompleted())
        this->notifyDone();
}

auto Task::markFailed() -> void {
    if (this->stateAtomic.markFailed())
        this->notifyDone();
}

auto Task::state() const -> TaskState {
    return this->stateAtomic.get();
}

auto Task::requestCancel() -> void {
    this->cancelled.store(true, std::memory_order_release);
}

auto Task::cancelRequested() const -> bool {
    return this->cancelled.load(std::memory_order_acquire);
}

auto Task::wait() const -> void {
    std::unique_lock<std::mutex> lock(this->doneMutex);
    this->doneCv.wait(lock, [this] { return this->stateAtomic.isTerminal(); });
}

auto Task::notifyDone() -> void {
    {
        // Pairs with the predicate check in wait(); the state itself is atomic.
        std::lock_guard<std::mutex> lock(this->doneMutex);
    }
    this->doneCv.notify_all();
}

} // namespace HN
