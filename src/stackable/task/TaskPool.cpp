#include <stackable/task/TaskPool.hpp>

#include <stackable/log/TaggedLogger.hpp>

#include <string>
#include <system_error>

namespace STK {

TaskPool::TaskPool(size_t threadCount) {
    stk_log("TaskPool::TaskPool constructing", "TaskPool");
    if (threadCount == 0) threadCount = 1;
    activeWorkers = 0;
    for (size_t i = 0; i < threadCount; ++i) {
        try {
            workers.emplace_back(&TaskPool::workerFunction, this);
            ++activeWorkers;
        } catch (std::system_error const& e) {
            stk_log(std::string("TaskPool::TaskPool failed to spawn worker: ") + e.what(), "TaskPool", "Error");
            break; // run with the workers we have
        }
    }
    stk_log("TaskPool::TaskPool constructed with workers=" + std::to_string(activeWorkers.load()), "TaskPool");
}

TaskPool::~TaskPool() {
    stk_log("TaskPool::~TaskPool", "TaskPool");
    shutdown();
}

auto TaskPool::submit(std::weak_ptr<Task>&& task) -> std::optional<Error> {
    std::lock_guard<std::mutex> lock(mutex);
    if (shuttingDown) {
        stk_log("TaskPool::submit refused: shutting down", "TaskPool");
        return Error{Error::Code::NotSupported, "Executor shutting down"};
    }
    if (workers.empty()) {
        return Error{Error::Code::CapacityExceeded, "Executor has no workers"};
    }
    auto locked = task.lock();
    if (!locked) {
        stk_log("TaskPool::submit task expired before enqueue", "TaskPool");
        return Error{Error::Code::UnknownError, "Task expired before enqueue"};
    }
    if (!locked->tryStart()) {
        // Already accepted by an executor; do not run it twice.
        stk_log("TaskPool::submit: task " + locked->label() + " already started", "TaskPool");
        return std::nullopt;
    }
    stk_log("TaskPool::submit enqueuing " + locked->label(), "TaskPool");
    tasks.push(std::move(task));
    taskCV.notify_one();
    return std::nullopt;
}

auto TaskPool::shutdown() -> void {
    stk_log("TaskPool::shutdown begin", "TaskPool");
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->shuttingDown) {
            stk_log("TaskPool::shutdown already in progress", "TaskPool");
        }
        this->shuttingDown = true;
        this->taskCV.notify_all();
    }

    for (auto& th : this->workers) {
        if (th.joinable() && th.get_id() != std::this_thread::get_id()) {
            th.join();
        }
    }
    activeWorkers = 0;
    stk_log("TaskPool::shutdown all workers joined", "TaskPool");

    std::lock_guard<std::mutex> lock(this->mutex);
    while (!this->tasks.empty()) {
        this->tasks.pop();
    }
}

auto TaskPool::size() const -> size_t {
    return this->workers.size();
}

auto TaskPool::queuedTaskCount() const -> size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->tasks.size();
}

auto TaskPool::workerFunction() -> void {
    stk_log("TaskPool::workerFunction start", "TaskPool");
    while (true) {
        std::weak_ptr<Task> task;
        {
            std::unique_lock<std::mutex> lock(mutex);
            taskCV.wait(lock, [this] { return this->shuttingDown || !this->tasks.empty(); });

            // Queued tasks are drained before the worker exits.
            if (this->shuttingDown && this->tasks.empty()) {
                break;
            }

            task = std::move(tasks.front());
            tasks.pop();
        }

        if (auto strongTask = task.lock()) {
            ++activeTasks;
            strongTask->run();
            --activeTasks;
        } else {
            stk_log("TaskPool::workerFunction task dropped before it ran", "TaskPool");
        }
    }

    stk_log("TaskPool::workerFunction exit", "TaskPool");
    --activeWorkers;
}

} // namespace STK
