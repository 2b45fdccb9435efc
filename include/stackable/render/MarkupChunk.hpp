#pragma once
#include <stackable/core/Ids.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace STK::Render {

enum class MarkerKind {
    None,      // plain markup
    Hydration, // <!--stk:hydration-->
    Head,      // <!--stk:head-->
    Body,      // <!--stk:body-->, document shell only
    Asset,     // <!--stk:asset:NAME-->
    Malformed  // unterminated or unknown <!--stk:...
};

[[nodiscard]] std::string_view MarkerKindName(MarkerKind kind);

struct MarkupChunk {
    std::string           text;     // markup, or the raw marker for marker chunks
    std::optional<NodeId> origin;   // empty for document shell chunks
    MarkerKind            marker{MarkerKind::None};
    std::string           argument; // asset name for Asset markers

    [[nodiscard]] bool is_marker() const { return marker != MarkerKind::None; }
};

inline constexpr std::string_view MarkerPrefix = "<!--stk:";
inline constexpr std::string_view MarkerSuffix = "-->";

// Splits markup into text and marker chunks and appends them to `out`.
// Empty text runs are not emitted.
void SplitMarkers(std::string_view markup, std::optional<NodeId> origin, std::vector<MarkupChunk>& out);

// Lazy, single-pass chunk sequence.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    virtual auto next() -> std::optional<MarkupChunk> = 0;
};

} // namespace STK::Render
