#include <stackable/hydration/HydrationPayload.hpp>

#include <alpaca/alpaca.h>

#include <cstring>
#include <exception>
#include <system_error>

namespace STK::Hydration {

namespace {

struct PayloadWire {
    std::vector<HydrationEntry> entries;
};

constexpr std::size_t HeaderSize = PayloadMagic.size() + 1 + sizeof(std::uint32_t);

constexpr char Base64Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

auto decode_base64_char(char ch) -> std::optional<std::uint32_t> {
    if (ch >= 'A' && ch <= 'Z')
        return static_cast<std::uint32_t>(ch - 'A');
    if (ch >= 'a' && ch <= 'z')
        return static_cast<std::uint32_t>(ch - 'a' + 26);
    if (ch >= '0' && ch <= '9')
        return static_cast<std::uint32_t>(ch - '0' + 52);
    if (ch == '+')
        return 62U;
    if (ch == '/')
        return 63U;
    return std::nullopt;
}

auto check_ordering(std::vector<HydrationEntry> const& entries) -> std::optional<Error> {
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].status > static_cast<std::uint8_t>(SlotStatus::Degraded)) {
            return Error{Error::Code::MalformedInput, "unknown slot status in entry " + std::to_string(i)};
        }
        if (i > 0 && entries[i].slot <= entries[i - 1].slot) {
            return Error{Error::Code::MalformedInput, "hydration entries are not in ascending slot order"};
        }
    }
    return std::nullopt;
}

} // namespace

auto encodePayload(HydrationPayload const& payload) -> Expected<std::vector<std::uint8_t>> {
    if (auto error = check_ordering(payload.entries)) {
        return std::unexpected(*error);
    }
    std::vector<std::uint8_t> body;
    try {
        PayloadWire wire{payload.entries};
        (void)alpaca::serialize<PayloadWire, 1>(wire, body);
    } catch (const std::exception& e) {
        return std::unexpected(Error{Error::Code::SerializationFailed, std::string("Payload serialization failed: ") + e.what()});
    }

    std::vector<std::uint8_t> out;
    out.reserve(HeaderSize + body.size());
    out.insert(out.end(), PayloadMagic.begin(), PayloadMagic.end());
    out.push_back(PayloadVersion);
    auto size = static_cast<std::uint32_t>(body.size());
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<std::uint8_t>((size >> shift) & 0xFFU));
    }
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

auto decodePayload(std::span<std::uint8_t const> bytes) -> Expected<HydrationPayload> {
    if (bytes.size() < HeaderSize) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Buffer too small for payload header"});
    }
    if (std::memcmp(bytes.data(), PayloadMagic.data(), PayloadMagic.size()) != 0) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Bad payload magic"});
    }
    if (bytes[PayloadMagic.size()] != PayloadVersion) {
        return std::unexpected(Error{Error::Code::NotSupported, "Unsupported payload version " + std::to_string(bytes[PayloadMagic.size()])});
    }
    std::uint32_t size = 0;
    for (int i = 0; i < 4; ++i) {
        size |= static_cast<std::uint32_t>(bytes[PayloadMagic.size() + 1 + i]) << (8 * i);
    }
    if (bytes.size() != HeaderSize + size) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Payload size does not match header"});
    }

    HydrationPayload payload;
    try {
        std::vector<std::uint8_t> body(bytes.begin() + HeaderSize, bytes.end());
        std::error_code           ec;
        auto                      wire = alpaca::deserialize<PayloadWire, 1>(body, ec);
        if (ec) {
            return std::unexpected(Error{Error::Code::UnserializableType, ec.message()});
        }
        payload.entries = std::move(wire.entries);
    } catch (const std::exception& e) {
        return std::unexpected(Error{Error::Code::UnserializableType, std::string("Payload deserialization failed: ") + e.what()});
    }
    if (auto error = check_ordering(payload.entries)) {
        return std::unexpected(*error);
    }
    return payload;
}

auto encodeBase64(std::span<std::uint8_t const> bytes) -> std::string {
    std::string output;
    output.reserve(((bytes.size() + 2) / 3) * 4);
    std::uint32_t chunk      = 0;
    int           chunk_bits = 0;
    for (auto byte : bytes) {
        chunk = (chunk << 8) | byte;
        chunk_bits += 8;
        while (chunk_bits >= 6) {
            chunk_bits -= 6;
            output.push_back(Base64Alphabet[(chunk >> chunk_bits) & 0x3F]);
        }
    }
    if (chunk_bits > 0) {
        chunk <<= (6 - chunk_bits);
        output.push_back(Base64Alphabet[chunk & 0x3F]);
    }
    while (output.size() % 4 != 0) {
        output.push_back('=');
    }
    return output;
}

auto decodeBase64(std::string_view text) -> std::optional<std::vector<std::uint8_t>> {
    if (text.size() % 4 != 0)
        return std::nullopt;
    std::size_t padding = 0;
    while (!text.empty() && text.back() == '=') {
        text.remove_suffix(1);
        ++padding;
    }
    if (padding > 2)
        return std::nullopt;
    std::vector<std::uint8_t> output;
    output.reserve((text.size() * 3) / 4);
    std::uint32_t chunk      = 0;
    int           chunk_bits = 0;
    for (char ch : text) {
        auto value = decode_base64_char(ch);
        if (!value)
            return std::nullopt;
        chunk = (chunk << 6) | *value;
        chunk_bits += 6;
        if (chunk_bits >= 8) {
            chunk_bits -= 8;
            output.push_back(static_cast<std::uint8_t>((chunk >> chunk_bits) & 0xFFU));
        }
    }
    // A lone trailing character carries no whole byte; leftover bits must be zero.
    if (chunk_bits >= 6 || (chunk & ((1U << chunk_bits) - 1U)) != 0)
        return std::nullopt;
    return output;
}

auto buildHydrationScript(std::span<std::uint8_t const> encodedPayload,
                          std::size_t                   slotCount,
                          std::string_view              elementId) -> std::string {
    auto        encoded = encodeBase64(encodedPayload);
    std::string script;
    script.reserve(encoded.size() + elementId.size() + 96);
    script.append("<script type=\"application/octet-stream\" id=\"");
    script.append(elementId);
    script.append("\" data-encoding=\"base64\" data-slots=\"");
    script.append(std::to_string(slotCount));
    script.append("\">");
    script.append(encoded);
    script.append("</script>");
    return script;
}

} // namespace STK::Hydration
