#pragma once
#include <stackable/core/Error.hpp>
#include <stackable/core/Ids.hpp>
#include <stackable/hydration/HydrationPayload.hpp>

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace STK::Hydration {

/**
 * StateRegistry — per-render, append-only map from bridge node to slot.
 *
 * Slots are handed out by reserve() in call order, which the scheduler makes
 * pre-order discovery order. Each slot is filled exactly once, either with
 * resolved state or as degraded. Entries are never removed or reordered, so
 * snapshot() is ordered by slot regardless of fill order.
 *
 * Not thread-safe: a registry belongs to one scheduler run.
 */
class StateRegistry {
public:
    struct Entry {
        NodeId                     node{InvalidNodeId};
        std::optional<SlotStatus>  status; // empty until filled
        std::vector<std::uint8_t>  state;
    };

    StateRegistry() = default;
    StateRegistry(StateRegistry const&)            = delete;
    StateRegistry& operator=(StateRegistry const&) = delete;

    // Returns the existing slot if the node was already reserved.
    auto reserve(NodeId node) -> SlotIndex;
    auto store(SlotIndex slot, std::vector<std::uint8_t> state) -> std::optional<Error>;
    auto markDegraded(SlotIndex slot) -> std::optional<Error>;

    [[nodiscard]] auto slotFor(NodeId node) const -> std::optional<SlotIndex>;
    [[nodiscard]] auto entry(SlotIndex slot) const -> Entry const*;
    [[nodiscard]] auto size() const -> std::size_t { return this->entries.size(); }
    [[nodiscard]] auto filledCount() const -> std::size_t { return this->filled; }
    [[nodiscard]] auto isComplete() const -> bool { return this->filled == this->entries.size(); }

    // Filled slots only, ascending slot order.
    [[nodiscard]] auto snapshot() const -> HydrationPayload;

private:
    auto fill(SlotIndex slot, SlotStatus status, std::vector<std::uint8_t> state) -> std::optional<Error>;

    std::vector<Entry>                    entries;
    std::unordered_map<NodeId, SlotIndex> slotsByNode;
    std::size_t                           filled{0};
};

} // namespace STK::Hydration
