#pragma once

#include <stackable/core/Error.hpp>
#include <stackable/render/RenderConfig.hpp>
#include <stackable/render/RenderSession.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace STK::Render {

inline auto resolution_error_to_json(ResolutionError const& error) -> nlohmann::json {
    nlohmann::json json{{"code", std::string{errorCodeToString(error.code)}}};
    if (error.message) {
        json["message"] = *error.message;
    }
    return json;
}

inline auto render_error_to_json(RenderError const& error) -> nlohmann::json {
    nlohmann::json json{{"code", std::string{errorCodeToString(error.code)}}, {"description", describeError(error)}};
    if (error.message) {
        json["message"] = *error.message;
    }
    if (error.node) {
        json["node"] = *error.node;
    }
    if (error.resolution) {
        json["resolution"] = resolution_error_to_json(*error.resolution);
    }
    return json;
}

inline auto degraded_node_to_json(DegradedNode const& node) -> nlohmann::json {
    return nlohmann::json{{"node", node.node},
                          {"slot", node.slot},
                          {"name", node.name},
                          {"error", resolution_error_to_json(node.error)}};
}

inline auto scheduler_stats_to_json(SchedulerStats const& stats) -> nlohmann::json {
    return nlohmann::json{{"discovered", stats.discovered},
                          {"started", stats.started},
                          {"resolved", stats.resolved},
                          {"failed", stats.failed},
                          {"timed_out", stats.timed_out},
                          {"cancelled", stats.cancelled},
                          {"discarded", stats.discarded},
                          {"peak_in_flight", stats.peak_in_flight}};
}

inline auto rewrite_stats_to_json(RewriteStats const& stats) -> nlohmann::json {
    return nlohmann::json{{"chunks", stats.chunks},
                          {"bytes_written", stats.bytes_written},
                          {"flushes", stats.flushes},
                          {"assets_resolved", stats.assets_resolved},
                          {"peak_buffered", stats.peak_buffered}};
}

inline auto render_config_to_json(RenderConfig const& config) -> nlohmann::json {
    nlohmann::json json{{"max_concurrent_resolutions", config.max_concurrent_resolutions},
                        {"global_timeout_ms", config.global_timeout.count()},
                        {"failure_mode", std::string{FailureModeName(config.failure_mode)}},
                        {"flush_threshold", config.flush_threshold},
                        {"hydration_element_id", config.hydration_element_id}};
    if (config.per_node_timeout) {
        json["per_node_timeout_ms"] = config.per_node_timeout->count();
    }
    if (config.live_reload_url) {
        json["live_reload_url"] = *config.live_reload_url;
    }
    return json;
}

inline auto SerializeRenderReport(RenderReport const& report) -> nlohmann::json {
    nlohmann::json degraded = nlohmann::json::array();
    for (auto const& node : report.degraded) {
        degraded.push_back(degraded_node_to_json(node));
    }

    std::size_t resolved_slots = 0;
    for (auto const& entry : report.hydration.entries) {
        if (entry.status == static_cast<std::uint8_t>(Hydration::SlotStatus::Resolved))
            ++resolved_slots;
    }

    return nlohmann::json{{"slots", report.hydration.entries.size()},
                          {"resolved_slots", resolved_slots},
                          {"degraded", std::move(degraded)},
                          {"scheduler", scheduler_stats_to_json(report.stats)},
                          {"rewrite", rewrite_stats_to_json(report.rewrite)}};
}

inline auto SerializeRenderOutput(RenderOutput const& output) -> nlohmann::json {
    auto json              = SerializeRenderReport(RenderReport{output.hydration, output.degraded, output.stats, output.rewrite});
    json["document_bytes"] = output.document.size();
    return json;
}

} // namespace STK::Render
