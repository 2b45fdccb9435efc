#include <stackable/hydration/StateRegistry.hpp>

#include <stackable/log/TaggedLogger.hpp>

#include <string>

namespace STK::Hydration {

auto StateRegistry::reserve(NodeId node) -> SlotIndex {
    if (auto it = this->slotsByNode.find(node); it != this->slotsByNode.end()) {
        return it->second;
    }
    auto slot = static_cast<SlotIndex>(this->entries.size());
    this->entries.push_back(Entry{.node = node, .status = std::nullopt, .state = {}});
    this->slotsByNode.emplace(node, slot);
    stk_log("StateRegistry::reserve node=" + std::to_string(node) + " slot=" + std::to_string(slot), "Slot");
    return slot;
}

auto StateRegistry::store(SlotIndex slot, std::vector<std::uint8_t> state) -> std::optional<Error> {
    return this->fill(slot, SlotStatus::Resolved, std::move(state));
}

auto StateRegistry::markDegraded(SlotIndex slot) -> std::optional<Error> {
    return this->fill(slot, SlotStatus::Degraded, {});
}

auto StateRegistry::fill(SlotIndex slot, SlotStatus status, std::vector<std::uint8_t> state) -> std::optional<Error> {
    if (slot >= this->entries.size()) {
        return Error{Error::Code::NoSuchSlot, "slot " + std::to_string(slot) + " was never reserved"};
    }
    auto& target = this->entries[slot];
    if (target.status) {
        return Error{Error::Code::SlotAlreadyFilled, "slot " + std::to_string(slot) + " is already filled"};
    }
    target.status = status;
    target.state  = std::move(state);
    ++this->filled;
    return std::nullopt;
}

auto StateRegistry::slotFor(NodeId node) const -> std::optional<SlotIndex> {
    if (auto it = this->slotsByNode.find(node); it != this->slotsByNode.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto StateRegistry::entry(SlotIndex slot) const -> Entry const* {
    if (slot >= this->entries.size())
        return nullptr;
    return &this->entries[slot];
}

auto StateRegistry::snapshot() const -> HydrationPayload {
    HydrationPayload payload;
    payload.entries.reserve(this->filled);
    for (std::size_t i = 0; i < this->entries.size(); ++i) {
        auto const& source = this->entries[i];
        if (!source.status)
            continue;
        payload.entries.push_back(HydrationEntry{.slot   = static_cast<std::uint32_t>(i),
                                                 .status = static_cast<std::uint8_t>(*source.status),
                                                 .state  = source.state});
    }
    return payload;
}

} // namespace STK::Hydration
