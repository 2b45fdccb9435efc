#include <stackable/render/RenderConfig.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>
#include <string>

namespace STK::Render {

namespace {

bool is_live_reload_url(std::string_view value) {
    return value.starts_with("ws://") || value.starts_with("wss://") || value.starts_with("http://")
           || value.starts_with("https://");
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T    value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

} // namespace

auto FailureModeName(FailureMode mode) -> std::string_view {
    switch (mode) {
    case FailureMode::FailFast:
        return "fail-fast";
    case FailureMode::BestEffort:
        return "best-effort";
    }
    return "unknown";
}

auto ParseFailureMode(std::string_view text) -> std::optional<FailureMode> {
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    std::replace(normalized.begin(), normalized.end(), '_', '-');
    if (normalized == "fail-fast" || normalized == "failfast") {
        return FailureMode::FailFast;
    }
    if (normalized == "best-effort" || normalized == "besteffort") {
        return FailureMode::BestEffort;
    }
    return std::nullopt;
}

bool IsValidElementId(std::string_view value) {
    if (value.empty() || std::isalpha(static_cast<unsigned char>(value.front())) == 0) {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isalnum(ch) != 0 || ch == '_' || ch == '-';
    });
}

auto ValidateRenderConfig(RenderConfig const& config) -> std::optional<std::string> {
    if (config.max_concurrent_resolutions == 0) {
        return std::string{"max_concurrent_resolutions must be > 0"};
    }
    if (config.global_timeout.count() <= 0) {
        return std::string{"global_timeout must be > 0ms"};
    }
    if (config.per_node_timeout && config.per_node_timeout->count() <= 0) {
        return std::string{"per_node_timeout must be > 0ms when set"};
    }
    if (config.flush_threshold == 0) {
        return std::string{"flush_threshold must be > 0"};
    }
    if (!IsValidElementId(config.hydration_element_id)) {
        return std::string{"hydration_element_id must start with a letter and contain only letters, numbers, '-', '_'"};
    }
    if (config.live_reload_url && !is_live_reload_url(*config.live_reload_url)) {
        return std::string{"live_reload_url must be a ws(s):// or http(s):// URL"};
    }
    if (config.live_reload_url
        && config.live_reload_url->find_first_of("\"'<>\\") != std::string::npos) {
        return std::string{"live_reload_url must not contain quotes, '<', '>' or '\\'"};
    }
    return std::nullopt;
}

bool ApplyRenderEnvOverrides(RenderConfig& config) {
    if (!apply_env("STACKABLE_MAX_CONCURRENT_RESOLUTIONS", [&](std::string_view value) {
            std::size_t parsed = 0;
            if (!parse_integer_in_range<std::size_t>(value, 1, 1024, parsed)) {
                std::cerr << "STACKABLE_MAX_CONCURRENT_RESOLUTIONS must be within 1-1024\n";
                return false;
            }
            config.max_concurrent_resolutions = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("STACKABLE_GLOBAL_TIMEOUT_MS", [&](std::string_view value) {
            std::int64_t parsed = 0;
            if (!parse_integer_in_range<std::int64_t>(value, 1, std::numeric_limits<std::int32_t>::max(), parsed)) {
                std::cerr << "STACKABLE_GLOBAL_TIMEOUT_MS must be a positive integer\n";
                return false;
            }
            config.global_timeout = std::chrono::milliseconds{parsed};
            return true;
        })) {
        return false;
    }

    if (!apply_env("STACKABLE_NODE_TIMEOUT_MS", [&](std::string_view value) {
            // "0" or empty turns the per-node deadline off.
            if (value.empty() || value == "0") {
                config.per_node_timeout.reset();
                return true;
            }
            std::int64_t parsed = 0;
            if (!parse_integer_in_range<std::int64_t>(value, 1, std::numeric_limits<std::int32_t>::max(), parsed)) {
                std::cerr << "STACKABLE_NODE_TIMEOUT_MS must be a non-negative integer\n";
                return false;
            }
            config.per_node_timeout = std::chrono::milliseconds{parsed};
            return true;
        })) {
        return false;
    }

    if (!apply_env("STACKABLE_FAILURE_MODE", [&](std::string_view value) {
            auto parsed = ParseFailureMode(value);
            if (!parsed) {
                std::cerr << "STACKABLE_FAILURE_MODE must be 'fail-fast' or 'best-effort'\n";
                return false;
            }
            config.failure_mode = *parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("STACKABLE_FLUSH_THRESHOLD", [&](std::string_view value) {
            std::size_t parsed = 0;
            if (!parse_integer_in_range<std::size_t>(value, 1, std::size_t{64} * 1024 * 1024, parsed)) {
                std::cerr << "STACKABLE_FLUSH_THRESHOLD must be within 1-67108864\n";
                return false;
            }
            config.flush_threshold = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("STACKABLE_LIVE_RELOAD_URL", [&](std::string_view value) {
            if (value.empty()) {
                config.live_reload_url.reset();
                return true;
            }
            if (!is_live_reload_url(value)) {
                std::cerr << "STACKABLE_LIVE_RELOAD_URL must be a ws(s):// or http(s):// URL\n";
                return false;
            }
            config.live_reload_url = std::string{value};
            return true;
        })) {
        return false;
    }

    return true;
}

} // namespace STK::Render
