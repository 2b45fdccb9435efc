#include <stackable/render/DocumentRewriter.hpp>

#include <stackable/hydration/HydrationPayload.hpp>
#include <stackable/hydration/StateRegistry.hpp>
#include <stackable/log/TaggedLogger.hpp>

#include <algorithm>

namespace STK::Render {

namespace {

auto rewrite_failed(std::string reason) -> RenderError {
    return RenderError{RenderError::Code::RewriteFailed, std::move(reason)};
}

auto escape_attribute(std::string_view value) -> std::string {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        switch (ch) {
        case '&':
            out += "&amp;";
            break;
        case '"':
            out += "&quot;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        default:
            out.push_back(ch);
            break;
        }
    }
    return out;
}

auto describe_origin(MarkupChunk const& chunk) -> std::string {
    if (!chunk.origin)
        return "document shell";
    return "node " + std::to_string(*chunk.origin);
}

} // namespace

auto BuildLiveReloadScript(std::string_view url) -> std::string {
    std::string socket_url{url};
    if (socket_url.starts_with("http://")) {
        socket_url.replace(0, 4, "ws");
    } else if (socket_url.starts_with("https://")) {
        socket_url.replace(0, 5, "wss");
    }
    return "<script>(function(){var s=new WebSocket(\"" + socket_url
           + "\");s.onmessage=function(){window.location.reload();};})();</script>";
}

DocumentRewriter::DocumentRewriter(Hydration::StateRegistry const& registry,
                                   std::vector<std::string> const& head_tags,
                                   AssetResolver const&            assets,
                                   RewriteOptions                  options)
    : registry_(registry), head_tags_(head_tags), assets_(assets), options_(std::move(options)) {
    buffer_.reserve(options_.flush_threshold);
}

auto DocumentRewriter::rewrite(ChunkSource& source, OutputSink& sink) -> RenderExpected<RewriteStats> {
    while (auto chunk = source.next()) {
        ++stats_.chunks;
        if (chunk->is_marker()) {
            if (auto err = handle_marker(*chunk, sink)) {
                return std::unexpected(std::move(*err));
            }
        } else if (!emit(chunk->text, sink)) {
            return std::unexpected(rewrite_failed("output sink refused a write"));
        }
    }
    if (!seen_hydration_) {
        return std::unexpected(rewrite_failed("document has no <!--stk:hydration--> marker"));
    }
    if (!seen_head_ && (!head_tags_.empty() || options_.live_reload_url)) {
        return std::unexpected(rewrite_failed("head content present but document has no <!--stk:head--> marker"));
    }
    if (!flush(sink)) {
        return std::unexpected(rewrite_failed("output sink refused a write"));
    }
    stk_log("Rewrote " + std::to_string(stats_.chunks) + " chunk(s) into " + std::to_string(stats_.bytes_written) + " byte(s)",
            "Rewriter");
    return stats_;
}

auto DocumentRewriter::handle_marker(MarkupChunk const& chunk, OutputSink& sink) -> std::optional<RenderError> {
    auto sink_error = [] { return rewrite_failed("output sink refused a write"); };

    switch (chunk.marker) {
    case MarkerKind::Hydration: {
        if (seen_hydration_) {
            return rewrite_failed("duplicate hydration marker in " + describe_origin(chunk));
        }
        seen_hydration_ = true;
        auto encoded    = Hydration::encodePayload(registry_.snapshot());
        if (!encoded) {
            return rewrite_failed("hydration payload: " + describeError(encoded.error()));
        }
        auto script = Hydration::buildHydrationScript(*encoded, registry_.size(), options_.hydration_element_id);
        if (!emit(script, sink))
            return sink_error();
        return std::nullopt;
    }
    case MarkerKind::Head: {
        if (seen_head_) {
            return rewrite_failed("duplicate head marker in " + describe_origin(chunk));
        }
        if (seen_hydration_) {
            return rewrite_failed("head marker after hydration marker in " + describe_origin(chunk));
        }
        seen_head_ = true;
        for (auto const& tag : head_tags_) {
            if (!emit(tag, sink))
                return sink_error();
        }
        if (options_.live_reload_url && !emit(BuildLiveReloadScript(*options_.live_reload_url), sink))
            return sink_error();
        return std::nullopt;
    }
    case MarkerKind::Asset: {
        auto reference = assets_.resolve(chunk.argument);
        if (!reference) {
            return rewrite_failed("unknown asset '" + chunk.argument + "' in " + describe_origin(chunk));
        }
        ++stats_.assets_resolved;
        if (!emit(escape_attribute(*reference), sink))
            return sink_error();
        return std::nullopt;
    }
    case MarkerKind::Body:
        return rewrite_failed("body marker outside the document shell in " + describe_origin(chunk));
    case MarkerKind::Malformed:
        return rewrite_failed("malformed marker '" + chunk.argument + "' in " + describe_origin(chunk));
    case MarkerKind::None:
        break;
    }
    return std::nullopt;
}

auto DocumentRewriter::emit(std::string_view text, OutputSink& sink) -> bool {
    if (text.empty())
        return true;
    if (buffer_.size() + text.size() > options_.flush_threshold) {
        if (!flush(sink))
            return false;
        if (text.size() >= options_.flush_threshold) {
            if (!sink.write(text))
                return false;
            ++stats_.flushes;
            stats_.bytes_written += text.size();
            return true;
        }
    }
    buffer_.append(text);
    stats_.peak_buffered = std::max(stats_.peak_buffered, buffer_.size());
    if (buffer_.size() >= options_.flush_threshold)
        return flush(sink);
    return true;
}

auto DocumentRewriter::flush(OutputSink& sink) -> bool {
    if (buffer_.empty())
        return true;
    if (!sink.write(buffer_))
        return false;
    ++stats_.flushes;
    stats_.bytes_written += buffer_.size();
    buffer_.clear();
    return true;
}

} // namespace STK::Render
