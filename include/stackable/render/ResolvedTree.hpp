#pragma once
#include <stackable/core/Ids.hpp>
#include <stackable/tree/ComponentTree.hpp>

#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace STK::Render {

class ResolutionScheduler;

/**
 * ResolvedTree — a copy of the component tree in which every reachable
 * bridge node has become a static node holding its resolved (or fallback)
 * markup. Only the scheduler creates one.
 */
class ResolvedTree {
public:
    [[nodiscard]] auto tree() const -> ComponentTree const& { return tree_; }

    // Head tags contributed by resolved bridges, in slot order.
    [[nodiscard]] auto head_tags() const -> std::vector<std::string> const& { return head_tags_; }

    // Markup of former bridge nodes is emitted verbatim, never scanned for markers.
    [[nodiscard]] auto is_former_bridge(NodeId id) const -> bool { return former_bridges_.contains(id); }

private:
    friend class ResolutionScheduler;

    explicit ResolvedTree(ComponentTree tree)
        : tree_(std::move(tree)) {}

    ComponentTree              tree_;
    std::vector<std::string>   head_tags_;
    std::unordered_set<NodeId> former_bridges_;
};

} // namespace STK::Render
