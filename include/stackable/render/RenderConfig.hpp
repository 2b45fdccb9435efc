#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace STK::Render {

enum class FailureMode {
    FailFast,  // first resolution failure aborts the render
    BestEffort // failed nodes render their fallback and are reported degraded
};

struct RenderConfig {
    std::size_t                              max_concurrent_resolutions{8};
    std::chrono::milliseconds                global_timeout{5000};
    std::optional<std::chrono::milliseconds> per_node_timeout;
    FailureMode                              failure_mode{FailureMode::FailFast};
    std::string                              fallback_markup{"<template data-stk-fallback></template>"};
    std::size_t                              flush_threshold{4096};
    std::string                              hydration_element_id{"stk-hydration"};
    std::optional<std::string>               live_reload_url;
};

auto FailureModeName(FailureMode mode) -> std::string_view;
auto ParseFailureMode(std::string_view text) -> std::optional<FailureMode>;

bool IsValidElementId(std::string_view value);

auto ValidateRenderConfig(RenderConfig const& config) -> std::optional<std::string>;

// Reads STACKABLE_* variables. Returns false, after printing the offending
// variable to stderr, if any value is unusable.
bool ApplyRenderEnvOverrides(RenderConfig& config);

} // namespace STK::Render
