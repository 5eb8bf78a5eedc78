#include <hnmd/task/TaskState.hpp>

namespace HN {

auto taskStateToString(TaskState state) -> std::string_view {
    switch (state) {
        case TaskState::NotStarted:
            return "NotStarted";
        case TaskState::Starting:
            return "Starting";
        case TaskState::Running:
            return "Running";
        case TaskState::Completed:
            return "Completed";
        case TaskState::Failed:
            return "Failed";
    }
    return "Unknown";
}

bool TaskStateAtomic::tryStart() {
    return this->state.advance(TaskState::NotStarted, TaskState::Starting);
}

bool TaskStateAtomic::transitionToRunning() {
    return this->state.advance(TaskState::Starting, TaskState::Running);
}

bool TaskStateAtomic::markCompleted() {
    return this->state.advance(TaskState::Running, TaskState::Completed);
}

bool TaskStateAtomic::markFailed() {
    return this->state.advanceFrom({TaskState::NotStarted, TaskState::Starting, TaskState::Running}, TaskState::Failed);
}

} // namespace HN
