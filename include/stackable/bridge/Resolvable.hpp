#pragma once
#include <stackable/core/Cancellation.hpp>
#include <stackable/core/Error.hpp>
#include <stackable/core/Ids.hpp>
#include <stackable/hydration/StateCodec.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace STK {
class ComponentTree;
class Task;
struct Executor;
} // namespace STK

namespace STK::Bridge {

// Request data every resolution of one render may read.
struct RenderRequest {
    std::string path{"/"};
    std::string query;
};

struct ResolutionContext {
    CancellationToken                    token;
    SlotIndex                            slot{0};
    std::string                          name;
    std::shared_ptr<RenderRequest const> request;
};

struct ResolvedState {
    std::string               markup;
    std::vector<std::uint8_t> state; // serialized, shipped to the client by slot
    std::vector<std::string>  head;  // tags for the document head
};

/**
 * Resolvable — capability of a bridge node.
 *
 * resolve() runs on an executor worker, may block on I/O and should poll
 * context.token (or sleep through token.waitFor) so cancellation ends it
 * promptly. It must not assume it runs only once per process; every render
 * calls it again.
 */
class Resolvable {
public:
    virtual ~Resolvable() = default;

    virtual auto resolve(ResolutionContext const& context) -> ResolutionExpected<ResolvedState> = 0;
};

/**
 * TypedResolvable — Resolvable built from a fetch step producing State and a
 * render step turning State into markup. State is serialized with
 * Hydration::encodeState, so the client decodes it with the same layout.
 */
template <typename State>
class TypedResolvable final : public Resolvable {
public:
    using Fetch  = std::function<ResolutionExpected<State>(ResolutionContext const&)>;
    using Render = std::function<std::string(State const&)>;
    using Head   = std::function<std::vector<std::string>(State const&)>;

    TypedResolvable(Fetch fetch, Render render, Head head = {})
        : fetch_(std::move(fetch)), render_(std::move(render)), head_(std::move(head)) {}

    auto resolve(ResolutionContext const& context) -> ResolutionExpected<ResolvedState> override {
        auto fetched = this->fetch_(context);
        if (!fetched) {
            return std::unexpected(fetched.error());
        }
        auto bytes = Hydration::encodeState(*fetched);
        if (!bytes) {
            return std::unexpected(ResolutionError{ResolutionError::Code::InternalFailure, describeError(bytes.error())});
        }
        ResolvedState resolved;
        resolved.markup = this->render_(*fetched);
        resolved.state  = std::move(*bytes);
        if (this->head_)
            resolved.head = this->head_(*fetched);
        return resolved;
    }

private:
    Fetch  fetch_;
    Render render_;
    Head   head_;
};

template <typename State>
auto makeResolvable(typename TypedResolvable<State>::Fetch  fetch,
                    typename TypedResolvable<State>::Render render,
                    typename TypedResolvable<State>::Head   head = {}) -> std::shared_ptr<Resolvable> {
    return std::make_shared<TypedResolvable<State>>(std::move(fetch), std::move(render), std::move(head));
}

namespace detail {

struct HandleState {
    std::mutex                                           mutex;
    std::condition_variable                              cv;
    std::optional<ResolutionExpected<ResolvedState>>     result;
    std::optional<std::chrono::steady_clock::time_point> startedAt; // set when the body begins on a worker
    bool                                                 consumed{false};
};

} // namespace detail

class ResolutionHandle;

// Starts the node's resolution on `executor` without blocking. The context
// token is the parent of the node's own cancellation source. `onStart` runs on
// the worker right before the body, `onComplete` once the body has returned.
auto beginResolution(ComponentTree const&            tree,
                     NodeId                          node,
                     Executor&                       executor,
                     ResolutionContext               context,
                     std::function<void(SlotIndex)> onComplete = {},
                     std::function<void(SlotIndex)> onStart    = {}) -> ResolutionExpected<ResolutionHandle>;

// Waits for the result. Timeout once `deadline` passes, Cancelled once the
// handle's token is cancelled. The result can be taken only once.
auto awaitResolution(ResolutionHandle&                                    handle,
                     std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt)
    -> ResolutionExpected<ResolvedState>;

/**
 * ResolutionHandle — in-flight resolution of one bridge node.
 *
 * Owns the node's task and cancellation source. Dropping a handle whose task
 * has not started yet means the task never runs.
 */
class ResolutionHandle {
public:
    ResolutionHandle() = default;

    [[nodiscard]] auto valid() const -> bool { return static_cast<bool>(this->state_); }
    [[nodiscard]] auto ready() const -> bool;
    // When the body started running on a worker; empty while still queued.
    [[nodiscard]] auto startedAt() const -> std::optional<std::chrono::steady_clock::time_point>;
    [[nodiscard]] auto node() const -> NodeId { return this->node_; }
    [[nodiscard]] auto slot() const -> SlotIndex { return this->slot_; }
    [[nodiscard]] auto token() const -> CancellationToken;

    auto cancel() -> void;

private:
    friend auto beginResolution(ComponentTree const&            tree,
                                NodeId                          node,
                                Executor&                       executor,
                                ResolutionContext               context,
                                std::function<void(SlotIndex)> onComplete,
                                std::function<void(SlotIndex)> onStart) -> ResolutionExpected<ResolutionHandle>;
    friend auto awaitResolution(ResolutionHandle&                                    handle,
                                std::optional<std::chrono::steady_clock::time_point> deadline)
        -> ResolutionExpected<ResolvedState>;

    std::shared_ptr<detail::HandleState> state_;
    std::shared_ptr<Task>                task_;
    std::shared_ptr<CancellationSource>  source_;
    NodeId                               node_{InvalidNodeId};
    SlotIndex                            slot_{0};
};

} // namespace STK::Bridge
