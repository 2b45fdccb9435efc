#pragma once
#include <stackable/task/TaskStateAtomic.hpp>

#include <functional>
#include <memory>
#include <string>

namespace STK {

/**
 * Task — one schedulable unit of work.
 *
 * Tasks are always owned through shared_ptr. Executors only hold weak
 * references: a task whose last owner lets go before it is dequeued is
 * silently skipped, which is how abandoned resolutions get dropped.
 */
class Task {
public:
    using Function = std::function<void(Task& task)>;

    static auto Create(Function fun, std::string label = {}) -> std::shared_ptr<Task>;

    auto isCompleted() const -> bool;
    auto isFailed() const -> bool;
    auto isTerminal() const -> bool;
    auto hasStarted() const -> bool;
    auto tryStart() -> bool;
    auto stateName() const -> std::string_view;
    auto label() const -> std::string const& { return this->label_; }

    // Runs the body on the calling thread: Starting -> Running -> Completed,
    // or Failed if the body throws. Executors call this from their workers.
    auto run() -> void;

private:
    Task()                       = default; // Private constructor - use Create()
    Task(const Task&)            = delete;
    Task& operator=(const Task&) = delete;
    Task(Task&&)                 = delete;
    Task& operator=(Task&&)      = delete;

    TaskStateAtomic state;
    Function        function;
    std::string     label_;
};

} // namespace STK
