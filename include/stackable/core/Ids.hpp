#pragma once
#include <cstdint>
#include <limits>

namespace STK {

// Index into a ComponentTree arena.
using NodeId = std::uint32_t;

// Position of a bridge node in hydration payload order.
using SlotIndex = std::uint32_t;

inline constexpr NodeId InvalidNodeId = std::numeric_limits<NodeId>::max();

} // namespace STK
