#include <stackable/tree/ComponentTree.hpp>

#include <unordered_set>
#include <utility>

namespace STK {

auto ComponentTree::push(Node node) -> NodeId {
    auto id = static_cast<NodeId>(this->nodes.size());
    this->nodes.push_back(std::move(node));
    return id;
}

auto ComponentTree::addStatic(std::string markup) -> NodeId {
    return this->push(Node{StaticNode{std::move(markup)}});
}

auto ComponentTree::addBridge(std::string name,
                              std::shared_ptr<Bridge::Resolvable> resolvable,
                              std::optional<std::string> fallback) -> NodeId {
    return this->push(Node{BridgeNode{std::move(name), std::move(resolvable), std::move(fallback)}});
}

auto ComponentTree::addComposite(std::string open, std::string close, std::vector<NodeId> children) -> NodeId {
    return this->push(Node{CompositeNode{std::move(open), std::move(close), std::move(children)}});
}

auto ComponentTree::appendChild(NodeId parent, NodeId child) -> std::optional<Error> {
    if (parent >= this->nodes.size() || child >= this->nodes.size()) {
        return Error{Error::Code::NoSuchNode, "appendChild references an unknown node"};
    }
    auto* composite = std::get_if<CompositeNode>(&this->nodes[parent].body);
    if (composite == nullptr) {
        return Error{Error::Code::InvalidTree, "only composite nodes have children"};
    }
    composite->children.push_back(child);
    return std::nullopt;
}

auto ComponentTree::setRoot(NodeId id) -> std::optional<Error> {
    if (id >= this->nodes.size()) {
        return Error{Error::Code::NoSuchNode, "root references an unknown node"};
    }
    this->rootId = id;
    return std::nullopt;
}

auto ComponentTree::node(NodeId id) const -> Node const* {
    if (id >= this->nodes.size())
        return nullptr;
    return &this->nodes[id];
}

auto ComponentTree::validate() const -> std::optional<Error> {
    if (!this->rootId) {
        return Error{Error::Code::InvalidTree, "tree has no root"};
    }
    enum class Mark : unsigned char { White, Grey, Black };
    std::vector<Mark> marks(this->nodes.size(), Mark::White);

    // Iterative three-colour DFS; a grey node reached again closes a cycle.
    std::vector<std::pair<NodeId, std::size_t>> stack;
    stack.emplace_back(*this->rootId, 0);
    marks[*this->rootId] = Mark::Grey;
    while (!stack.empty()) {
        auto& [id, next] = stack.back();
        auto const* composite = this->nodes[id].asComposite();
        if (composite == nullptr || next >= composite->children.size()) {
            marks[id] = Mark::Black;
            stack.pop_back();
            continue;
        }
        auto child = composite->children[next++];
        if (child >= this->nodes.size()) {
            return Error{Error::Code::NoSuchNode, "node " + std::to_string(id) + " has unknown child " + std::to_string(child)};
        }
        if (marks[child] == Mark::Grey) {
            return Error{Error::Code::InvalidTree, "cycle through node " + std::to_string(child)};
        }
        if (marks[child] == Mark::White) {
            marks[child] = Mark::Grey;
            stack.emplace_back(child, 0);
        }
    }
    return std::nullopt;
}

auto ComponentTree::preorder() const -> std::vector<NodeId> {
    std::vector<NodeId> order;
    if (!this->rootId)
        return order;
    std::vector<NodeId> stack{*this->rootId};
    while (!stack.empty()) {
        auto id = stack.back();
        stack.pop_back();
        order.push_back(id);
        if (auto const* composite = this->nodes[id].asComposite()) {
            for (auto it = composite->children.rbegin(); it != composite->children.rend(); ++it)
                stack.push_back(*it);
        }
    }
    return order;
}

auto ComponentTree::reachableBridges() const -> std::vector<NodeId> {
    std::vector<NodeId>        bridges;
    std::unordered_set<NodeId> seen;
    for (auto id : this->preorder()) {
        if (this->nodes[id].kind() == NodeKind::Bridge && seen.insert(id).second)
            bridges.push_back(id);
    }
    return bridges;
}

auto ComponentTree::replaceWithStatic(NodeId id, std::string markup) -> std::optional<Error> {
    if (id >= this->nodes.size()) {
        return Error{Error::Code::NoSuchNode, "replaceWithStatic references an unknown node"};
    }
    this->nodes[id].body = StaticNode{std::move(markup)};
    return std::nullopt;
}

} // namespace STK
