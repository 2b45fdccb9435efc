#pragma once
#include <stackable/core/Error.hpp>
#include <stackable/task/Executor.hpp>
#include <stackable/task/Task.hpp>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace STK {

// Fixed-size worker pool. There is no shared instance;
// each render session owns or borrows one.
class TaskPool : public Executor {
public:
    explicit TaskPool(size_t threadCount = std::thread::hardware_concurrency());
    ~TaskPool() override;

    TaskPool(TaskPool const&)                    = delete;
    auto operator=(TaskPool const&) -> TaskPool& = delete;

    using Executor::submit;
    auto submit(std::weak_ptr<Task>&& task) -> std::optional<Error> override;
    auto shutdown() -> void override;
    auto size() const -> size_t override;

    auto activeTaskCount() const -> size_t { return this->activeTasks.load(); }
    auto queuedTaskCount() const -> size_t;

private:
    auto workerFunction() -> void;

    std::vector<std::jthread>       workers;
    std::queue<std::weak_ptr<Task>> tasks;
    mutable std::mutex              mutex;
    std::condition_variable         taskCV;
    std::atomic<bool>               shuttingDown{false};
    std::atomic<size_t>             activeWorkers{0};
    std::atomic<size_t>             activeTasks{0};
};

} // namespace STK
