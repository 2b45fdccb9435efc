#include <stackable/core/Cancellation.hpp>

#include <stackable/log/TaggedLogger.hpp>

#include <algorithm>
#include <thread>

namespace STK {

namespace detail {

auto CancellationState::cancel() -> void {
    std::vector<std::weak_ptr<CancellationState>> toCancel;
    std::vector<std::function<void()>>            toRun;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->cancelled.exchange(true))
            return;
        toCancel.swap(this->children);
        for (auto& entry : this->callbacks)
            toRun.push_back(std::move(entry.second));
        this->callbacks.clear();
    }
    this->cv.notify_all();
    for (auto& callback : toRun)
        callback();
    for (auto& weak : toCancel) {
        if (auto child = weak.lock())
            child->cancel();
    }
}

auto CancellationState::attachChild(std::shared_ptr<CancellationState> const& child) -> void {
    bool alreadyCancelled = false;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->cancelled.load()) {
            alreadyCancelled = true;
        } else {
            // Prune children that already went away so long-lived parents stay small.
            std::erase_if(this->children, [](auto const& weak) { return weak.expired(); });
            this->children.push_back(child);
        }
    }
    if (alreadyCancelled)
        child->cancel();
}

} // namespace detail

CancellationToken::CancellationToken(std::shared_ptr<detail::CancellationState> state)
    : state_(std::move(state)) {}

auto CancellationToken::isCancelled() const -> bool {
    return this->state_ && this->state_->cancelled.load(std::memory_order_acquire);
}

auto CancellationToken::waitUntil(std::chrono::steady_clock::time_point deadline) const -> bool {
    if (!this->state_) {
        std::this_thread::sleep_until(deadline);
        return false;
    }
    std::unique_lock<std::mutex> lock(this->state_->mutex);
    return this->state_->cv.wait_until(lock, deadline, [this] { return this->state_->cancelled.load(); });
}

auto CancellationToken::onCancel(std::function<void()> callback) const -> std::uint64_t {
    if (!this->state_)
        return 0;
    {
        std::lock_guard<std::mutex> lock(this->state_->mutex);
        if (!this->state_->cancelled.load()) {
            auto id = this->state_->nextCallbackId++;
            this->state_->callbacks.emplace_back(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

auto CancellationToken::removeCallback(std::uint64_t id) const -> void {
    if (!this->state_ || id == 0)
        return;
    std::lock_guard<std::mutex> lock(this->state_->mutex);
    std::erase_if(this->state_->callbacks, [id](auto const& entry) { return entry.first == id; });
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

CancellationSource::CancellationSource(CancellationToken const& parent)
    : state_(std::make_shared<detail::CancellationState>()) {
    if (parent.state_)
        parent.state_->attachChild(this->state_);
}

auto CancellationSource::cancel() -> void {
    stk_log("CancellationSource::cancel", "Cancellation");
    this->state_->cancel();
}

auto CancellationSource::isCancelled() const -> bool {
    return this->state_->cancelled.load(std::memory_order_acquire);
}

auto CancellationSource::token() const -> CancellationToken {
    return CancellationToken{this->state_};
}

} // namespace STK
