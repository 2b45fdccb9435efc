#include <stackable/render/MarkupChunk.hpp>

namespace STK::Render {

namespace {

auto classify(std::string_view body, MarkupChunk& chunk) -> void {
    if (body == "hydration") {
        chunk.marker = MarkerKind::Hydration;
    } else if (body == "head") {
        chunk.marker = MarkerKind::Head;
    } else if (body == "body") {
        chunk.marker = MarkerKind::Body;
    } else if (body.starts_with("asset:") && body.size() > 6) {
        chunk.marker   = MarkerKind::Asset;
        chunk.argument = std::string{body.substr(6)};
    } else {
        chunk.marker   = MarkerKind::Malformed;
        chunk.argument = std::string{body};
    }
}

} // namespace

std::string_view MarkerKindName(MarkerKind kind) {
    switch (kind) {
    case MarkerKind::None:
        return "none";
    case MarkerKind::Hydration:
        return "hydration";
    case MarkerKind::Head:
        return "head";
    case MarkerKind::Body:
        return "body";
    case MarkerKind::Asset:
        return "asset";
    case MarkerKind::Malformed:
        return "malformed";
    }
    return "unknown";
}

void SplitMarkers(std::string_view markup, std::optional<NodeId> origin, std::vector<MarkupChunk>& out) {
    std::size_t offset = 0;
    while (offset < markup.size()) {
        auto start = markup.find(MarkerPrefix, offset);
        if (start == std::string_view::npos) {
            out.push_back(MarkupChunk{std::string{markup.substr(offset)}, origin, MarkerKind::None, {}});
            return;
        }
        if (start > offset) {
            out.push_back(MarkupChunk{std::string{markup.substr(offset, start - offset)}, origin, MarkerKind::None, {}});
        }
        auto body_start = start + MarkerPrefix.size();
        auto end        = markup.find(MarkerSuffix, body_start);
        if (end == std::string_view::npos) {
            out.push_back(MarkupChunk{std::string{markup.substr(start)}, origin, MarkerKind::Malformed, "unterminated marker"});
            return;
        }
        MarkupChunk chunk{std::string{markup.substr(start, end + MarkerSuffix.size() - start)}, origin, MarkerKind::None, {}};
        classify(markup.substr(body_start, end - body_start), chunk);
        out.push_back(std::move(chunk));
        offset = end + MarkerSuffix.size();
    }
}

} // namespace STK::Render
