#pragma once
#include <stackable/task/TaskState.hpp>

#include <atomic>
#include <string_view>

namespace STK {

// Thread-safe wrapper for managing task state transitions
struct TaskStateAtomic {
    TaskStateAtomic() = default;                              // Default constructor initializes to NotStarted
    TaskStateAtomic(const TaskStateAtomic& other);            // Copy constructor takes a snapshot of the other state
    TaskStateAtomic& operator=(const TaskStateAtomic& other); // Copy assignment takes a snapshot of the other state

    // Move operations are deleted because std::atomic is non-movable
    TaskStateAtomic(TaskStateAtomic&& other)            = delete;
    TaskStateAtomic& operator=(TaskStateAtomic&& other) = delete;

    bool tryStart();            // NotStarted -> Starting. False if already started
    bool transitionToRunning(); // Starting -> Running. False if not in Starting state
    bool markCompleted();       // Running -> Completed. False if not in Running state
    bool markFailed();          // Any non-terminal state -> Failed. False if already Completed
    bool isTerminal() const;    // Completed or Failed
    bool hasStarted() const;    // Any state except NotStarted
    bool isCompleted() const;
    bool isFailed() const;
    bool isRunning() const;

    TaskState        get() const;      // Current state with acquire semantics
    std::string_view toString() const; // String representation of current state

private:
    std::atomic<TaskState> state{TaskState::NotStarted};
};

} // namespace STK
