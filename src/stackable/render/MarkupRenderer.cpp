#include <stackable/render/MarkupRenderer.hpp>

#include <stackable/log/TaggedLogger.hpp>

#include <string>

namespace STK::Render {

namespace {

auto scan_into(std::deque<MarkupChunk>& pending, std::string_view markup, NodeId origin) -> void {
    std::vector<MarkupChunk> chunks;
    SplitMarkers(markup, origin, chunks);
    for (auto& chunk : chunks)
        pending.push_back(std::move(chunk));
}

} // namespace

MarkupRenderer::MarkupRenderer(ResolvedTree const& tree, DocumentShell const& shell)
    : tree_(tree), shell_(shell) {}

auto MarkupRenderer::next() -> std::optional<MarkupChunk> {
    while (pending_.empty() && phase_ != Phase::Done) {
        advance();
    }
    if (pending_.empty())
        return std::nullopt;
    auto chunk = std::move(pending_.front());
    pending_.pop_front();
    ++emitted_;
    return chunk;
}

auto MarkupRenderer::advance() -> void {
    switch (phase_) {
    case Phase::Prefix:
        pending_.insert(pending_.end(), shell_.prefix().begin(), shell_.prefix().end());
        if (auto root = tree_.tree().root())
            stack_.push_back(Frame{*root});
        phase_ = Phase::Tree;
        break;
    case Phase::Tree:
        if (stack_.empty()) {
            phase_ = Phase::Suffix;
        } else {
            step_tree();
        }
        break;
    case Phase::Suffix:
        pending_.insert(pending_.end(), shell_.suffix().begin(), shell_.suffix().end());
        phase_ = Phase::Done;
        break;
    case Phase::Done:
        break;
    }
}

auto MarkupRenderer::step_tree() -> void {
    auto&       frame = stack_.back();
    auto const* node  = tree_.tree().node(frame.id);
    if (node == nullptr) {
        stack_.pop_back();
        return;
    }

    if (auto const* composite = node->asComposite()) {
        if (!frame.opened) {
            frame.opened = true;
            scan_into(pending_, composite->open, frame.id);
        } else if (frame.next_child < composite->children.size()) {
            auto child = composite->children[frame.next_child++];
            // `frame` is invalidated by the push.
            stack_.push_back(Frame{child});
        } else {
            auto id = frame.id;
            stack_.pop_back();
            scan_into(pending_, composite->close, id);
        }
        return;
    }

    auto id = frame.id;
    stack_.pop_back();
    if (auto const* markup = node->asStatic()) {
        if (tree_.is_former_bridge(id)) {
            if (!markup->markup.empty())
                pending_.push_back(MarkupChunk{markup->markup, id, MarkerKind::None, {}});
        } else {
            scan_into(pending_, markup->markup, id);
        }
        return;
    }
    // Every reachable bridge was replaced by the scheduler.
    stk_log("Skipping unresolved bridge node " + std::to_string(id), "Renderer");
}

} // namespace STK::Render
