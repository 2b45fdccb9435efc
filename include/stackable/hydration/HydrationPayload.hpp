#pragma once
#include <stackable/core/Error.hpp>
#include <stackable/core/Ids.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace STK::Hydration {

enum class SlotStatus : std::uint8_t {
    Resolved = 0,
    Degraded = 1 // best-effort fallback was rendered; state is empty
};

struct HydrationEntry {
    std::uint32_t             slot{0};
    std::uint8_t              status{0};
    std::vector<std::uint8_t> state;

    bool operator==(HydrationEntry const&) const = default;
};

struct HydrationPayload {
    std::vector<HydrationEntry> entries; // ascending slot order

    bool operator==(HydrationPayload const&) const = default;
};

// Wire format: "STKH" | version:u8 | body-size:u32 little endian | alpaca body.
inline constexpr std::array<std::uint8_t, 4> PayloadMagic{'S', 'T', 'K', 'H'};
inline constexpr std::uint8_t                PayloadVersion = 1;

[[nodiscard]] auto encodePayload(HydrationPayload const& payload) -> Expected<std::vector<std::uint8_t>>;
[[nodiscard]] auto decodePayload(std::span<std::uint8_t const> bytes) -> Expected<HydrationPayload>;

// RFC 4648 base64 with padding, so the client can use atob().
[[nodiscard]] auto encodeBase64(std::span<std::uint8_t const> bytes) -> std::string;
[[nodiscard]] auto decodeBase64(std::string_view text) -> std::optional<std::vector<std::uint8_t>>;

[[nodiscard]] auto buildHydrationScript(std::span<std::uint8_t const> encodedPayload,
                                        std::size_t                   slotCount,
                                        std::string_view              elementId) -> std::string;

} // namespace STK::Hydration
