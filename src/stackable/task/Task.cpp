#include <stackable/task/Task.hpp>

#include <stackable/log/TaggedLogger.hpp>

#include <exception>

namespace STK {

auto Task::Create(Function fun, std::string label) -> std::shared_ptr<Task> {
    auto task      = std::shared_ptr<Task>(new Task{});
    task->function = std::move(fun);
    task->label_   = std::move(label);
    return task;
}

auto Task::isCompleted() const -> bool {
    return this->state.isCompleted();
}

auto Task::isFailed() const -> bool {
    return this->state.isFailed();
}

auto Task::isTerminal() const -> bool {
    return this->state.isTerminal();
}

auto Task::hasStarted() const -> bool {
    return this->state.hasStarted();
}

auto Task::tryStart() -> bool {
    return this->state.tryStart();
}

auto Task::stateName() const -> std::string_view {
    return this->state.toString();
}

auto Task::run() -> void {
    // Executors that skip tryStart() (e.g. inline test executors) still get a valid transition.
    this->state.tryStart();
    if (!this->state.transitionToRunning()) {
        stk_log("Task::run refused: task " + this->label_ + " is " + std::string(this->state.toString()), "Task");
        return;
    }
    try {
        stk_log("Task::run executing " + this->label_, "Task");
        if (this->function)
            this->function(*this);
        this->state.markCompleted();
    } catch (std::exception const& e) {
        this->state.markFailed();
        stk_log("Task " + this->label_ + " threw: " + e.what(), "Task", "Error");
    } catch (...) {
        this->state.markFailed();
        stk_log("Task " + this->label_ + " threw a non-standard exception", "Task", "Error");
    }
}

} // namespace STK
