#pragma once

#include <stackable/core/Error.hpp>

#include <cstddef>
#include <memory>
#include <optional>

namespace STK {

class Task;

/**
 * Executor — interface for scheduling and executing Tasks
 *
 * Contract
 * --------
 * - submit(...) returns std::nullopt on success, or an Error on refusal
 *   (e.g., executor shutting down).
 * - Accepted tasks are run through Task::run() on some worker thread.
 * - shutdown() stops accepting new tasks, wakes workers and lets in-flight
 *   tasks finish.
 * - size() returns an implementation-defined measure of capacity
 *   (e.g., number of worker threads).
 *
 * Thread-safety
 * -------------
 * Implementations must be thread-safe for concurrent submit() calls and
 * for shutdown() to be called while tasks may still be in flight.
 */
struct Executor {
    virtual ~Executor() = default;

    // Primary submission API — accepts a weak reference to decouple lifetime.
    virtual auto submit(std::weak_ptr<Task>&&) -> std::optional<Error> = 0;

    auto submit(std::shared_ptr<Task> const& task) -> std::optional<Error> {
        return submit(std::weak_ptr<Task>(task));
    }

    virtual auto shutdown() -> void = 0;

    virtual auto size() const -> size_t = 0;
};

} // namespace STK
