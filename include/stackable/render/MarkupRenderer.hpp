#pragma once
#include <stackable/core/Ids.hpp>
#include <stackable/render/DocumentShell.hpp>
#include <stackable/render/MarkupChunk.hpp>
#include <stackable/render/ResolvedTree.hpp>

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace STK::Render {

/**
 * MarkupRenderer — walks a ResolvedTree in pre-order and yields its markup
 * wrapped in the document shell. Each next() call does at most one node's
 * worth of work; the walk is not restartable.
 */
class MarkupRenderer final : public ChunkSource {
public:
    MarkupRenderer(ResolvedTree const& tree, DocumentShell const& shell);

    auto next() -> std::optional<MarkupChunk> override;

    [[nodiscard]] auto chunks_emitted() const -> std::size_t { return emitted_; }

private:
    enum class Phase {
        Prefix,
        Tree,
        Suffix,
        Done
    };

    struct Frame {
        NodeId      id;
        std::size_t next_child{0};
        bool        opened{false};
    };

    auto advance() -> void;
    auto step_tree() -> void;

    ResolvedTree const&     tree_;
    DocumentShell const&    shell_;
    Phase                   phase_{Phase::Prefix};
    std::vector<Frame>      stack_;
    std::deque<MarkupChunk> pending_;
    std::size_t             emitted_{0};
};

} // namespace STK::Render
