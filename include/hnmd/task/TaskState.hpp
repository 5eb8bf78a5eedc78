#pragma once
#include <hnmd/core/AtomicState.hpp>

#include <string_view>

namespace HN {

enum class TaskState {
    NotStarted, // Created, not yet handed to an executor
    Starting,   // Accepted by an executor, waiting for a worker
    Running,
    Completed,
    Failed // The body threw, or the executor refused or abandoned the task
};

[[nodiscard]] auto taskStateToString(TaskState state) -> std::string_view;

// NotStarted -> Starting -> Running -> Completed, with Failed reachable from
// every state that is not terminal.
struct TaskStateAtomic {
    bool tryStart();            // false if the task was already submitted
    bool transitionToRunning(); // false unless Starting
    bool markCompleted();       // false unless Running
    bool markFailed();          // false if already terminal

    bool isTerminal() const { return this->state.in({TaskState::Completed, TaskState::Failed}); }
    bool hasStarted() const { return this->state.get() != TaskState::NotStarted; }
    bool isCompleted() const { return this->state.get() == TaskState::Completed; }
    bool isFailed() const { return this->state.get() == TaskState::Failed; }

    TaskState        get() const { return this->state.get(); }
    std::string_view toString() const { return taskStateToString(this->get()); }

private:
    AtomicState<TaskState> state{TaskState::NotStarted};
};

} // namespace HN
