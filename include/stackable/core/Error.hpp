#pragma once
#include <stackable/core/Ids.hpp>

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace STK {

struct Error {
    enum class Code {
        UnknownError = 0,
        MalformedInput,
        InvalidTree,
        NoSuchNode,
        NoSuchSlot,
        SlotAlreadyFilled,
        SerializationFailed,
        UnserializableType,
        NotSupported,
        CapacityExceeded
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

struct ResolutionError {
    enum class Code {
        Timeout = 0,
        DependencyFailed,
        Cancelled,
        InternalFailure
    };

    ResolutionError(Code c, std::string m = {})
        : code(c) {
        if (!m.empty())
            message = std::move(m);
    }

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using ResolutionExpected = std::expected<T, ResolutionError>;

struct RenderError {
    enum class Code {
        ResolutionFailed = 0,
        RewriteFailed,
        SessionTimeout,
        SessionCancelled,
        InvalidConfig,
        InvalidTree,
        InternalFailure
    };

    RenderError(Code c, std::string m = {})
        : code(c) {
        if (!m.empty())
            message = std::move(m);
    }

    static auto ResolutionFailed(NodeId node, ResolutionError error) -> RenderError {
        RenderError out{Code::ResolutionFailed};
        out.node       = node;
        out.resolution = std::move(error);
        return out;
    }

    Code                           code;
    std::optional<std::string>     message;
    std::optional<NodeId>          node;       // set for ResolutionFailed
    std::optional<ResolutionError> resolution; // set for ResolutionFailed
};

template <typename T>
using RenderExpected = std::expected<T, RenderError>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::InvalidTree:
        return "invalid_tree";
    case Error::Code::NoSuchNode:
        return "no_such_node";
    case Error::Code::NoSuchSlot:
        return "no_such_slot";
    case Error::Code::SlotAlreadyFilled:
        return "slot_already_filled";
    case Error::Code::SerializationFailed:
        return "serialization_failed";
    case Error::Code::UnserializableType:
        return "unserializable_type";
    case Error::Code::NotSupported:
        return "not_supported";
    case Error::Code::CapacityExceeded:
        return "capacity_exceeded";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto errorCodeToString(ResolutionError::Code code) -> std::string_view {
    switch (code) {
    case ResolutionError::Code::Timeout:
        return "timeout";
    case ResolutionError::Code::DependencyFailed:
        return "dependency_failed";
    case ResolutionError::Code::Cancelled:
        return "cancelled";
    case ResolutionError::Code::InternalFailure:
        return "internal_failure";
    }
    return "internal_failure";
}

[[nodiscard]] inline auto errorCodeToString(RenderError::Code code) -> std::string_view {
    switch (code) {
    case RenderError::Code::ResolutionFailed:
        return "resolution_failed";
    case RenderError::Code::RewriteFailed:
        return "rewrite_failed";
    case RenderError::Code::SessionTimeout:
        return "session_timeout";
    case RenderError::Code::SessionCancelled:
        return "session_cancelled";
    case RenderError::Code::InvalidConfig:
        return "invalid_config";
    case RenderError::Code::InvalidTree:
        return "invalid_tree";
    case RenderError::Code::InternalFailure:
        return "internal_failure";
    }
    return "internal_failure";
}

namespace detail {

inline auto appendLabelled(std::string_view label, std::optional<std::string> const& message) -> std::string {
    if (message && !message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(message->data(), message->size());
        return description;
    }
    return std::string{label};
}

} // namespace detail

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    return detail::appendLabelled(errorCodeToString(error.code), error.message);
}

[[nodiscard]] inline auto describeError(ResolutionError const& error) -> std::string {
    return detail::appendLabelled(errorCodeToString(error.code), error.message);
}

[[nodiscard]] inline auto describeError(RenderError const& error) -> std::string {
    auto description = detail::appendLabelled(errorCodeToString(error.code), error.message);
    if (error.node) {
        description.append(" node=");
        description.append(std::to_string(*error.node));
    }
    if (error.resolution) {
        description.append(" cause=");
        description.append(describeError(*error.resolution));
    }
    return description;
}

} // namespace STK
