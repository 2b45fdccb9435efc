#pragma once
#include <stackable/bridge/Resolvable.hpp>
#include <stackable/core/Cancellation.hpp>
#include <stackable/core/Error.hpp>
#include <stackable/core/Ids.hpp>
#include <stackable/render/RenderConfig.hpp>
#include <stackable/render/ResolvedTree.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace STK {
struct Executor;
namespace Hydration {
class StateRegistry;
}
} // namespace STK

namespace STK::Render {

// A bridge that failed under best-effort and was replaced by its fallback.
struct DegradedNode {
    NodeId          node{InvalidNodeId};
    SlotIndex       slot{0};
    std::string     name;
    ResolutionError error;
};

struct SchedulerStats {
    std::size_t discovered{0};
    std::size_t started{0};
    std::size_t resolved{0};
    std::size_t failed{0};
    std::size_t timed_out{0};
    std::size_t cancelled{0};
    std::size_t discarded{0}; // completions that arrived after the node was already terminal
    std::size_t peak_in_flight{0};
};

struct ScheduleResult {
    ResolvedTree              tree;
    std::vector<DegradedNode> degraded;
    SchedulerStats            stats;
};

/**
 * ResolutionScheduler — turns a component tree into a ResolvedTree and fills
 * the state registry.
 *
 * Slots are reserved for every reachable bridge in pre-order before anything
 * starts. Bridges are then admitted in slot order, at most
 * max_concurrent_resolutions at a time, and their completions are processed
 * on the calling thread in whatever order they arrive. A scheduler runs once.
 */
class ResolutionScheduler {
public:
    ResolutionScheduler(Executor&                                   executor,
                        RenderConfig const&                         config,
                        Hydration::StateRegistry&                   registry,
                        CancellationToken                           session,
                        std::shared_ptr<Bridge::RenderRequest const> request = {});

    auto run(ComponentTree const& tree, std::chrono::steady_clock::time_point deadline) -> RenderExpected<ScheduleResult>;

    // Valid after run(), whether it succeeded or not.
    [[nodiscard]] auto stats() const -> SchedulerStats const& { return stats_; }

private:
    Executor&                                    executor_;
    RenderConfig const&                          config_;
    Hydration::StateRegistry&                    registry_;
    CancellationToken                            session_;
    std::shared_ptr<Bridge::RenderRequest const> request_;
    SchedulerStats                               stats_;
    bool                                         used_{false};
};

} // namespace STK::Render
