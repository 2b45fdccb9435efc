#pragma once
#include <string_view>

namespace STK {

// Represents the possible states of a task
enum class TaskState {
    NotStarted, // Initial state when task is created
    Starting,   // Task was accepted by an executor and is queued
    Running,    // Task is actively executing
    Completed,  // Task finished successfully
    Failed      // Task body threw
};

constexpr std::string_view taskStateToString(TaskState state) {
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

} // namespace STK
