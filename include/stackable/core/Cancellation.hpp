#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace STK {

namespace detail {
struct CancellationState;
}

/**
 * CancellationToken — read side of a cooperative cancellation flag.
 *
 * Tokens form a tree: cancelling a source cancels every token derived from it
 * (and their children), never the parent. Work observes cancellation by
 * polling isCancelled() or by sleeping through waitFor(), which wakes early.
 *
 * A default-constructed token is never cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] auto isCancelled() const -> bool;

    // Sleeps for at most `duration`. Returns true if the token was cancelled
    // before or during the wait.
    template <typename Rep, typename Period>
    auto waitFor(std::chrono::duration<Rep, Period> const& duration) const -> bool {
        return this->waitUntil(std::chrono::steady_clock::now()
                               + std::chrono::duration_cast<std::chrono::steady_clock::duration>(duration));
    }
    auto waitUntil(std::chrono::steady_clock::time_point deadline) const -> bool;

    // Registers a callback run once on cancellation (immediately if already
    // cancelled). Callbacks run on the cancelling thread and must not block.
    auto onCancel(std::function<void()> callback) const -> std::uint64_t;
    auto removeCallback(std::uint64_t id) const -> void;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state);

    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource();
    // Creates a source linked below `parent`.
    explicit CancellationSource(CancellationToken const& parent);

    auto cancel() -> void;
    [[nodiscard]] auto isCancelled() const -> bool;
    [[nodiscard]] auto token() const -> CancellationToken;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

namespace detail {

struct CancellationState {
    auto cancel() -> void;
    auto attachChild(std::shared_ptr<CancellationState> const& child) -> void;

    std::atomic<bool>                                   cancelled{false};
    std::mutex                                          mutex;
    std::condition_variable                             cv;
    std::vector<std::weak_ptr<CancellationState>>       children;
    std::vector<std::pair<std::uint64_t, std::function<void()>>> callbacks;
    std::uint64_t                                       nextCallbackId{1};
};

} // namespace detail

} // namespace STK
