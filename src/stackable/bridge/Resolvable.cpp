#include <stackable/bridge/Resolvable.hpp>

#include <stackable/log/TaggedLogger.hpp>
#include <stackable/task/Executor.hpp>
#include <stackable/task/Task.hpp>
#include <stackable/tree/ComponentTree.hpp>

#include <exception>
#include <string>

namespace STK::Bridge {

namespace {

auto run_resolution(Resolvable& resolvable, ResolutionContext const& context) -> ResolutionExpected<ResolvedState> {
    if (context.token.isCancelled()) {
        return std::unexpected(ResolutionError{ResolutionError::Code::Cancelled, "cancelled before start"});
    }
    try {
        return resolvable.resolve(context);
    } catch (std::exception const& e) {
        return std::unexpected(ResolutionError{ResolutionError::Code::InternalFailure, std::string("resolve threw: ") + e.what()});
    } catch (...) {
        return std::unexpected(ResolutionError{ResolutionError::Code::InternalFailure, "resolve threw a non-standard exception"});
    }
}

} // namespace

auto ResolutionHandle::ready() const -> bool {
    if (!this->state_)
        return false;
    std::lock_guard<std::mutex> lock(this->state_->mutex);
    return this->state_->result.has_value();
}

auto ResolutionHandle::startedAt() const -> std::optional<std::chrono::steady_clock::time_point> {
    if (!this->state_)
        return std::nullopt;
    std::lock_guard<std::mutex> lock(this->state_->mutex);
    return this->state_->startedAt;
}

auto ResolutionHandle::token() const -> CancellationToken {
    if (!this->source_)
        return CancellationToken{};
    return this->source_->token();
}

auto ResolutionHandle::cancel() -> void {
    if (this->source_)
        this->source_->cancel();
}

auto beginResolution(ComponentTree const&            tree,
                     NodeId                          node,
                     Executor&                       executor,
                     ResolutionContext               context,
                     std::function<void(SlotIndex)> onComplete,
                     std::function<void(SlotIndex)> onStart) -> ResolutionExpected<ResolutionHandle> {
    auto const* target = tree.node(node);
    if (target == nullptr) {
        return std::unexpected(ResolutionError{ResolutionError::Code::InternalFailure, "unknown node " + std::to_string(node)});
    }
    auto const* bridge = target->asBridge();
    if (bridge == nullptr) {
        return std::unexpected(ResolutionError{ResolutionError::Code::InternalFailure,
                                               "node " + std::to_string(node) + " is a " + std::string(nodeKindToString(target->kind())) + " node, not a bridge"});
    }
    if (!bridge->resolvable) {
        return std::unexpected(ResolutionError{ResolutionError::Code::InternalFailure, "bridge '" + bridge->name + "' has no resolvable"});
    }

    ResolutionHandle handle;
    handle.node_   = node;
    handle.slot_   = context.slot;
    handle.state_  = std::make_shared<detail::HandleState>();
    handle.source_ = std::make_shared<CancellationSource>(context.token);
    if (context.name.empty())
        context.name = bridge->name;
    context.token = handle.source_->token();

    // Wake awaiters when the node is cancelled; the weak reference keeps the
    // callback harmless once the handle is gone.
    std::weak_ptr<detail::HandleState> weakState = handle.state_;
    context.token.onCancel([weakState] {
        if (auto state = weakState.lock()) {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->cv.notify_all();
        }
    });

    auto slot = context.slot;
    handle.task_ = Task::Create(
        [state = handle.state_, resolvable = bridge->resolvable, context = std::move(context), onComplete = std::move(onComplete),
         onStart = std::move(onStart), slot](Task&) {
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->startedAt = std::chrono::steady_clock::now();
            }
            if (onStart)
                onStart(slot);
            auto result = run_resolution(*resolvable, context);
            stk_log("bridge '" + context.name + "' finished " + (result ? "ok" : describeError(result.error())), "Slot");
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->result = std::move(result);
            }
            state->cv.notify_all();
            if (onComplete)
                onComplete(slot);
        },
        "bridge:" + bridge->name);

    if (auto refused = executor.submit(handle.task_)) {
        return std::unexpected(ResolutionError{ResolutionError::Code::InternalFailure, "executor refused bridge '" + bridge->name + "': " + describeError(*refused)});
    }
    return handle;
}

auto awaitResolution(ResolutionHandle&                                    handle,
                     std::optional<std::chrono::steady_clock::time_point> deadline) -> ResolutionExpected<ResolvedState> {
    if (!handle.state_) {
        return std::unexpected(ResolutionError{ResolutionError::Code::InternalFailure, "invalid resolution handle"});
    }
    auto                         token = handle.token();
    auto&                        state = *handle.state_;
    std::unique_lock<std::mutex> lock(state.mutex);
    if (state.consumed) {
        return std::unexpected(ResolutionError{ResolutionError::Code::InternalFailure, "resolution result already taken"});
    }
    auto finished = [&] { return state.result.has_value() || token.isCancelled(); };
    if (deadline) {
        if (!state.cv.wait_until(lock, *deadline, finished)) {
            return std::unexpected(ResolutionError{ResolutionError::Code::Timeout, "deadline passed"});
        }
    } else {
        state.cv.wait(lock, finished);
    }
    if (state.result.has_value()) {
        state.consumed = true;
        auto result    = std::move(*state.result);
        state.result.reset();
        return result;
    }
    return std::unexpected(ResolutionError{ResolutionError::Code::Cancelled, "resolution cancelled"});
}

} // namespace STK::Bridge
