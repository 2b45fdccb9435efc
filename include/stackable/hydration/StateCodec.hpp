#pragma once
#include <stackable/core/Error.hpp>

#include <alpaca/alpaca.h>

#include <cstdint>
#include <exception>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace STK::Hydration {

// Single-field wrapper so alpaca can handle non-aggregate state types too.
template <typename T>
struct Wrapper {
    T obj;
};

template <typename T>
[[nodiscard]] inline auto encodeState(T const& value) -> Expected<std::vector<std::uint8_t>> {
    try {
        Wrapper<T>           wrapper{value};
        std::vector<uint8_t> bytes;
        (void)alpaca::serialize<Wrapper<T>, 1>(wrapper, bytes);
        return bytes;
    } catch (const std::exception& e) {
        return std::unexpected(Error{Error::Code::SerializationFailed, std::string("State serialization failed: ") + e.what()});
    }
}

template <typename T>
[[nodiscard]] inline auto decodeState(std::span<std::uint8_t const> bytes) -> Expected<T> {
    try {
        std::vector<uint8_t> buffer(bytes.begin(), bytes.end());
        std::error_code      ec;
        auto                 wrapper = alpaca::deserialize<Wrapper<T>, 1>(buffer, ec);
        if (ec) {
            return std::unexpected(Error{Error::Code::UnserializableType, ec.message()});
        }
        return std::move(wrapper.obj);
    } catch (const std::exception& e) {
        return std::unexpected(Error{Error::Code::UnserializableType, std::string("State deserialization failed: ") + e.what()});
    }
}

} // namespace STK::Hydration
