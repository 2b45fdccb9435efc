#pragma once
#include <stackable/core/Error.hpp>
#include <stackable/core/Ids.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace STK {

namespace Bridge {
class Resolvable;
}

enum class NodeKind {
    Static,
    Bridge,
    Composite
};

[[nodiscard]] constexpr auto nodeKindToString(NodeKind kind) -> std::string_view {
    switch (kind) {
    case NodeKind::Static:
        return "static";
    case NodeKind::Bridge:
        return "bridge";
    case NodeKind::Composite:
        return "composite";
    }
    return "unknown";
}

struct StaticNode {
    std::string markup;
};

struct BridgeNode {
    std::string                         name;
    std::shared_ptr<Bridge::Resolvable> resolvable;
    std::optional<std::string>          fallback; // rendered instead of the configured placeholder
};

struct CompositeNode {
    std::string         open;
    std::string         close;
    std::vector<NodeId> children;
};

struct Node {
    std::variant<StaticNode, BridgeNode, CompositeNode> body;

    [[nodiscard]] auto kind() const -> NodeKind { return static_cast<NodeKind>(this->body.index()); }

    [[nodiscard]] auto asStatic() const -> StaticNode const* { return std::get_if<StaticNode>(&this->body); }
    [[nodiscard]] auto asBridge() const -> BridgeNode const* { return std::get_if<BridgeNode>(&this->body); }
    [[nodiscard]] auto asComposite() const -> CompositeNode const* { return std::get_if<CompositeNode>(&this->body); }
};

/**
 * ComponentTree — arena of nodes addressed by NodeId.
 *
 * Children are plain ids, so one node may appear under several parents. The
 * tree owns every node; nothing outside it holds owning references. Cycles
 * can be built through appendChild() but are rejected by validate(), which
 * every render pass runs before touching the tree.
 */
class ComponentTree {
public:
    auto addStatic(std::string markup) -> NodeId;
    auto addBridge(std::string name,
                   std::shared_ptr<Bridge::Resolvable> resolvable,
                   std::optional<std::string> fallback = std::nullopt) -> NodeId;
    auto addComposite(std::string open, std::string close, std::vector<NodeId> children = {}) -> NodeId;

    auto appendChild(NodeId parent, NodeId child) -> std::optional<Error>;
    auto setRoot(NodeId id) -> std::optional<Error>;

    [[nodiscard]] auto root() const -> std::optional<NodeId> { return this->rootId; }
    [[nodiscard]] auto node(NodeId id) const -> Node const*;
    [[nodiscard]] auto size() const -> std::size_t { return this->nodes.size(); }

    // Root present, every child id known, no node reachable from itself.
    [[nodiscard]] auto validate() const -> std::optional<Error>;

    // Pre-order node occurrences from the root. Shared nodes appear once per
    // parent reference. Only meaningful on a tree that validates.
    [[nodiscard]] auto preorder() const -> std::vector<NodeId>;

    // Distinct bridge nodes reachable from the root, in first-discovery order.
    [[nodiscard]] auto reachableBridges() const -> std::vector<NodeId>;

    // Swaps a node's body for static markup, keeping its id.
    auto replaceWithStatic(NodeId id, std::string markup) -> std::optional<Error>;

private:
    auto push(Node node) -> NodeId;

    std::vector<Node>     nodes;
    std::optional<NodeId> rootId;
};

} // namespace STK
