#include <stackable/render/RenderSession.hpp>

#include <stackable/log/TaggedLogger.hpp>
#include <stackable/render/MarkupRenderer.hpp>
#include <stackable/task/TaskPool.hpp>
#include <stackable/tree/ComponentTree.hpp>

#include <chrono>

namespace STK::Render {

RenderSession::RenderSession(RenderConfig config, AssetResolver const& assets, Executor& executor, Bridge::RenderRequest request)
    : config_(std::move(config)),
      assets_(assets),
      executor_(executor),
      request_(std::make_shared<Bridge::RenderRequest const>(std::move(request))) {}

RenderSession::RenderSession(RenderConfig config, AssetResolver const& assets, Bridge::RenderRequest request)
    : config_(std::move(config)),
      assets_(assets),
      owned_pool_(std::make_unique<TaskPool>(config_.max_concurrent_resolutions)),
      executor_(*owned_pool_),
      request_(std::make_shared<Bridge::RenderRequest const>(std::move(request))) {}

RenderSession::~RenderSession() {
    cancel_.cancel();
    if (owned_pool_)
        owned_pool_->shutdown();
}

auto RenderSession::cancel() -> void {
    stk_log("RenderSession::cancel", "Session");
    cancel_.cancel();
}

auto RenderSession::render(ComponentTree const& tree, DocumentShell const& shell) -> RenderExpected<RenderOutput> {
    StringSink sink;
    auto       report = render_to(tree, shell, sink);
    if (!report) {
        return std::unexpected(std::move(report.error()));
    }
    return RenderOutput{sink.take(),
                        std::move(report->hydration),
                        std::move(report->degraded),
                        report->stats,
                        report->rewrite};
}

auto RenderSession::render_to(ComponentTree const& tree, DocumentShell const& shell, OutputSink& sink)
    -> RenderExpected<RenderReport> {
    if (used_.exchange(true)) {
        return std::unexpected(RenderError{RenderError::Code::InternalFailure, "render session already used"});
    }
    if (auto invalid = ValidateRenderConfig(config_)) {
        return std::unexpected(RenderError{RenderError::Code::InvalidConfig, *invalid});
    }
    stk_log("Rendering " + request_->path + " (" + std::string(FailureModeName(config_.failure_mode)) + ")", "Session");

    auto                deadline = std::chrono::steady_clock::now() + config_.global_timeout;
    ResolutionScheduler scheduler{executor_, config_, registry_, cancel_.token(), request_};
    auto                scheduled = scheduler.run(tree, deadline);
    if (!scheduled) {
        stk_log("Render failed during resolution: " + describeError(scheduled.error()), "Session", "Error");
        return std::unexpected(std::move(scheduled.error()));
    }

    MarkupRenderer   renderer{scheduled->tree, shell};
    DocumentRewriter rewriter{registry_,
                              scheduled->tree.head_tags(),
                              assets_,
                              RewriteOptions{config_.flush_threshold, config_.hydration_element_id, config_.live_reload_url}};
    auto             rewritten = rewriter.rewrite(renderer, sink);
    if (!rewritten) {
        stk_log("Render failed during rewrite: " + describeError(rewritten.error()), "Session", "Error");
        return std::unexpected(std::move(rewritten.error()));
    }
    return RenderReport{registry_.snapshot(), std::move(scheduled->degraded), scheduled->stats, *rewritten};
}

auto RenderDocument(ComponentTree const&  tree,
                    RenderConfig const&   config,
                    AssetResolver const&  assets,
                    DocumentShell const&  shell,
                    Bridge::RenderRequest request) -> RenderExpected<RenderOutput> {
    RenderSession session{config, assets, std::move(request)};
    return session.render(tree, shell);
}

} // namespace STK::Render
