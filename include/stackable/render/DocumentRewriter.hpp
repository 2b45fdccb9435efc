#pragma once
#include <stackable/core/Error.hpp>
#include <stackable/render/AssetResolver.hpp>
#include <stackable/render/MarkupChunk.hpp>
#include <stackable/render/OutputSink.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace STK::Hydration {
class StateRegistry;
}

namespace STK::Render {

struct RewriteOptions {
    std::size_t                flush_threshold{4096};
    std::string                hydration_element_id{"stk-hydration"};
    std::optional<std::string> live_reload_url;
};

struct RewriteStats {
    std::size_t chunks{0};
    std::size_t bytes_written{0};
    std::size_t flushes{0};
    std::size_t assets_resolved{0};
    std::size_t peak_buffered{0};
};

// Script that reloads the page when the dev server announces a rebuild.
auto BuildLiveReloadScript(std::string_view url) -> std::string;

/**
 * DocumentRewriter — fills markers while streaming chunks to a sink.
 *
 * Text passes through a coalescing buffer that is flushed once it reaches
 * flush_threshold; a chunk larger than that is written straight through.
 * The hydration payload is taken from the registry, which must be complete
 * before rewriting starts. Any structural problem ends the rewrite with
 * RenderError::RewriteFailed; bytes already written stay written.
 */
class DocumentRewriter {
public:
    DocumentRewriter(Hydration::StateRegistry const& registry,
                     std::vector<std::string> const& head_tags,
                     AssetResolver const&            assets,
                     RewriteOptions                  options);

    auto rewrite(ChunkSource& source, OutputSink& sink) -> RenderExpected<RewriteStats>;

private:
    auto handle_marker(MarkupChunk const& chunk, OutputSink& sink) -> std::optional<RenderError>;
    auto emit(std::string_view text, OutputSink& sink) -> bool;
    auto flush(OutputSink& sink) -> bool;

    Hydration::StateRegistry const& registry_;
    std::vector<std::string> const& head_tags_;
    AssetResolver const&            assets_;
    RewriteOptions                  options_;

    std::string  buffer_;
    RewriteStats stats_;
    bool         seen_head_{false};
    bool         seen_hydration_{false};
};

} // namespace STK::Render
