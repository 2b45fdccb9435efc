#include <stackable/render/ResolutionScheduler.hpp>

#include <stackable/hydration/StateRegistry.hpp>
#include <stackable/log/TaggedLogger.hpp>
#include <stackable/task/Executor.hpp>
#include <stackable/tree/ComponentTree.hpp>

#include <algorithm>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace STK::Render {

namespace {

using Clock = std::chrono::steady_clock;

enum class NodeState {
    Discovered,
    Resolving,
    Resolved,
    Failed,
    TimedOut,
    Cancelled
};

[[nodiscard]] bool is_terminal(NodeState state) {
    return state != NodeState::Discovered && state != NodeState::Resolving;
}

// Slots whose resolution started or finished, pushed from worker threads and
// drained by the scheduler thread.
struct CompletionQueue {
    struct Batch {
        std::deque<SlotIndex> started;
        std::deque<SlotIndex> finished;
    };

    std::mutex              mutex;
    std::condition_variable cv;
    Batch                   pending;
    bool                    interrupted{false};

    auto push_started(SlotIndex slot) -> void {
        {
            std::lock_guard<std::mutex> lock(mutex);
            pending.started.push_back(slot);
        }
        cv.notify_all();
    }

    auto push(SlotIndex slot) -> void {
        {
            std::lock_guard<std::mutex> lock(mutex);
            pending.finished.push_back(slot);
        }
        cv.notify_all();
    }

    auto interrupt() -> void {
        {
            std::lock_guard<std::mutex> lock(mutex);
            interrupted = true;
        }
        cv.notify_all();
    }

    // Returns whatever started or completed by `until`, possibly nothing.
    auto drain_until(Clock::time_point until) -> Batch {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_until(lock, until, [this] { return !pending.started.empty() || !pending.finished.empty() || interrupted; });
        Batch out;
        std::swap(out, pending);
        return out;
    }
};

struct NodeRecord {
    NodeId                           node{InvalidNodeId};
    SlotIndex                        slot{0};
    std::string                      name;
    std::optional<std::string>       fallback;
    NodeState                        state{NodeState::Discovered};
    Bridge::ResolutionHandle         handle;
    std::optional<Clock::time_point> deadline; // per-node, counted from the moment the body starts
    bool                             occupying{false}; // holds an admission slot until its body returns
    std::vector<std::string>         head;
};

} // namespace

ResolutionScheduler::ResolutionScheduler(Executor&                                   executor,
                                         RenderConfig const&                         config,
                                         Hydration::StateRegistry&                   registry,
                                         CancellationToken                           session,
                                         std::shared_ptr<Bridge::RenderRequest const> request)
    : executor_(executor), config_(config), registry_(registry), session_(std::move(session)), request_(std::move(request)) {
    if (!request_)
        request_ = std::make_shared<Bridge::RenderRequest const>();
}

auto ResolutionScheduler::run(ComponentTree const& tree, Clock::time_point deadline) -> RenderExpected<ScheduleResult> {
    if (used_) {
        return std::unexpected(RenderError{RenderError::Code::InternalFailure, "resolution scheduler already ran"});
    }
    used_ = true;
    if (registry_.size() != 0) {
        return std::unexpected(RenderError{RenderError::Code::InternalFailure, "state registry already holds slots"});
    }
    if (auto invalid = tree.validate()) {
        return std::unexpected(RenderError{RenderError::Code::InvalidTree, describeError(*invalid)});
    }
    if (session_.isCancelled()) {
        return std::unexpected(RenderError{RenderError::Code::SessionCancelled, "cancelled before resolution"});
    }

    ResolvedTree            resolved{tree};
    std::vector<NodeRecord> records;
    for (auto id : tree.reachableBridges()) {
        auto const* bridge = tree.node(id)->asBridge();
        NodeRecord  record;
        record.node     = id;
        record.slot     = registry_.reserve(id);
        record.name     = bridge->name;
        record.fallback = bridge->fallback;
        records.push_back(std::move(record));
        resolved.former_bridges_.insert(id);
    }
    stats_.discovered = records.size();
    stk_log("Scheduling " + std::to_string(records.size()) + " bridge(s), max in flight "
                + std::to_string(config_.max_concurrent_resolutions),
            "Scheduler");

    std::vector<DegradedNode> degraded;
    if (records.empty()) {
        return ScheduleResult{std::move(resolved), std::move(degraded), stats_};
    }

    CancellationSource run_source{session_};
    auto               queue     = std::make_shared<CompletionQueue>();
    auto               run_token = run_source.token();
    auto               wake_id   = run_token.onCancel([queue] { queue->interrupt(); });

    // Stops stragglers and unhooks the wake callback on every exit path.
    struct RunGuard {
        CancellationSource& source;
        CancellationToken&  token;
        std::uint64_t       wake_id;
        ~RunGuard() {
            token.removeCallback(wake_id);
            source.cancel();
        }
    } guard{run_source, run_token, wake_id};

    std::size_t next_to_start = 0;
    std::size_t in_flight     = 0;
    std::size_t finished      = 0;

    auto cancel_in_flight = [&]() {
        for (auto& record : records) {
            if (record.state == NodeState::Resolving) {
                record.handle.cancel();
                record.state = NodeState::Cancelled;
                ++stats_.cancelled;
            }
            record.occupying = false;
        }
        in_flight = 0;
    };

    // Settles a failed node. Returns the error that ends the run under fail-fast.
    auto settle_failure = [&](NodeRecord& record, ResolutionError error) -> std::optional<RenderError> {
        switch (error.code) {
        case ResolutionError::Code::Timeout:
            record.state = NodeState::TimedOut;
            ++stats_.timed_out;
            break;
        case ResolutionError::Code::Cancelled:
            record.state = NodeState::Cancelled;
            ++stats_.cancelled;
            break;
        default:
            record.state = NodeState::Failed;
            ++stats_.failed;
            break;
        }
        ++finished;
        stk_log("Bridge '" + record.name + "' slot " + std::to_string(record.slot) + " failed: " + describeError(error), "Scheduler");

        if (config_.failure_mode == FailureMode::FailFast) {
            run_source.cancel();
            cancel_in_flight();
            return RenderError::ResolutionFailed(record.node, std::move(error));
        }
        if (auto err = registry_.markDegraded(record.slot)) {
            return RenderError{RenderError::Code::InternalFailure, describeError(*err)};
        }
        if (auto err = resolved.tree_.replaceWithStatic(record.node, record.fallback.value_or(config_.fallback_markup))) {
            return RenderError{RenderError::Code::InternalFailure, describeError(*err)};
        }
        degraded.push_back(DegradedNode{record.node, record.slot, record.name, std::move(error)});
        return std::nullopt;
    };

    auto start = [&](NodeRecord& record) -> std::optional<RenderError> {
        Bridge::ResolutionContext context{run_token, record.slot, record.name, request_};
        auto handle = Bridge::beginResolution(
                tree, record.node, executor_, std::move(context),
                [queue](SlotIndex slot) { queue->push(slot); },
                [queue](SlotIndex slot) { queue->push_started(slot); });
        if (!handle) {
            return settle_failure(record, handle.error());
        }
        record.handle    = std::move(*handle);
        record.state     = NodeState::Resolving;
        record.occupying = true;
        ++stats_.started;
        ++in_flight;
        stats_.peak_in_flight = std::max(stats_.peak_in_flight, in_flight);
        stk_log("Started bridge '" + record.name + "' slot " + std::to_string(record.slot), "Slot");
        return std::nullopt;
    };

    auto complete = [&](NodeRecord& record) -> std::optional<RenderError> {
        if (record.occupying) {
            record.occupying = false;
            --in_flight;
        }
        if (is_terminal(record.state)) {
            ++stats_.discarded;
            stk_log("Discarding late completion for slot " + std::to_string(record.slot), "Slot");
            return std::nullopt;
        }
        auto result = Bridge::awaitResolution(record.handle, Clock::now());
        if (!result) {
            return settle_failure(record, result.error());
        }
        if (auto err = registry_.store(record.slot, std::move(result->state))) {
            return RenderError{RenderError::Code::InternalFailure, describeError(*err)};
        }
        if (auto err = resolved.tree_.replaceWithStatic(record.node, std::move(result->markup))) {
            return RenderError{RenderError::Code::InternalFailure, describeError(*err)};
        }
        record.head  = std::move(result->head);
        record.state = NodeState::Resolved;
        ++stats_.resolved;
        ++finished;
        return std::nullopt;
    };

    while (finished < records.size()) {
        if (session_.isCancelled()) {
            cancel_in_flight();
            return std::unexpected(RenderError{RenderError::Code::SessionCancelled});
        }

        while (next_to_start < records.size() && in_flight < config_.max_concurrent_resolutions) {
            if (auto fatal = start(records[next_to_start++])) {
                return std::unexpected(std::move(*fatal));
            }
        }
        if (finished == records.size())
            break;

        auto wake_at = deadline;
        for (auto const& record : records) {
            if (record.state == NodeState::Resolving && record.deadline)
                wake_at = std::min(wake_at, *record.deadline);
        }

        auto batch = queue->drain_until(wake_at);
        // Session cancellation reaches the nodes first; their Cancelled results must not read as failures.
        if (session_.isCancelled()) {
            cancel_in_flight();
            return std::unexpected(RenderError{RenderError::Code::SessionCancelled});
        }
        for (auto slot : batch.started) {
            if (slot >= records.size())
                continue;
            auto& record = records[slot];
            if (record.state != NodeState::Resolving || !config_.per_node_timeout)
                continue;
            auto started_at = record.handle.startedAt().value_or(Clock::now());
            record.deadline = started_at + *config_.per_node_timeout;
        }
        for (auto slot : batch.finished) {
            if (slot >= records.size()) {
                return std::unexpected(RenderError{RenderError::Code::InternalFailure, "completion for unknown slot " + std::to_string(slot)});
            }
            if (auto fatal = complete(records[slot])) {
                return std::unexpected(std::move(*fatal));
            }
        }
        if (finished == records.size())
            break;

        auto now = Clock::now();
        if (now >= deadline) {
            stk_log("Global deadline passed with " + std::to_string(in_flight) + " resolution(s) in flight", "Scheduler");
            run_source.cancel();
            cancel_in_flight();
            return std::unexpected(RenderError{RenderError::Code::SessionTimeout,
                                               "exceeded " + std::to_string(config_.global_timeout.count()) + "ms"});
        }
        for (auto& record : records) {
            if (record.state != NodeState::Resolving || !record.deadline || now < *record.deadline)
                continue;
            // The body may ignore cancellation; it keeps its admission slot until it returns.
            record.handle.cancel();
            auto timeout = ResolutionError{ResolutionError::Code::Timeout,
                                           "exceeded " + std::to_string(config_.per_node_timeout->count()) + "ms"};
            if (auto fatal = settle_failure(record, std::move(timeout))) {
                return std::unexpected(std::move(*fatal));
            }
        }
    }

    for (auto& record : records) {
        for (auto& tag : record.head)
            resolved.head_tags_.push_back(std::move(tag));
    }
    stk_log("Resolved " + std::to_string(stats_.resolved) + " of " + std::to_string(stats_.discovered) + " bridge(s), "
                + std::to_string(degraded.size()) + " degraded",
            "Scheduler");
    return ScheduleResult{std::move(resolved), std::move(degraded), stats_};
}

} // namespace STK::Render
