#pragma once

#include <hnmd/core/Error.hpp>

#include <cstddef>
#include <memory>
#include <optional>

namespace HN {

struct Task;

/**
 * Executor: interface for scheduling and executing Tasks
 *
 * Contract
 * --------
 * - submit(...) returns std::nullopt on success, or an Error on refusal
 *   (e.g., executor shutting down).
 * - shutdown() stops accepting new tasks, wakes workers and lets running
 *   tasks finish.
 * - size() returns the number of worker threads.
 *
 * Implementations must be thread-safe for concurrent submit() calls and for
 * shutdown() to be called while tasks may still be in flight.
 */
struct Executor {
    virtual ~Executor() = default;

    virtual auto submit(std::weak_ptr<Task>&&) -> std::optional<Error> = 0;

    auto submit(std::shared_ptr<Task> const& task) -> std::optional<Error> {
        return submit(std::weak_ptr<Task>(task));
    }

    virtual auto shutdown() -> void = 0;

    virtual auto size() const -> std::size_t = 0;
};

} // namespace HN
