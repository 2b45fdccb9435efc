#pragma once
#include <stackable/bridge/Resolvable.hpp>
#include <stackable/core/Cancellation.hpp>
#include <stackable/core/Error.hpp>
#include <stackable/hydration/HydrationPayload.hpp>
#include <stackable/hydration/StateRegistry.hpp>
#include <stackable/render/AssetResolver.hpp>
#include <stackable/render/DocumentRewriter.hpp>
#include <stackable/render/DocumentShell.hpp>
#include <stackable/render/OutputSink.hpp>
#include <stackable/render/RenderConfig.hpp>
#include <stackable/render/ResolutionScheduler.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace STK {
class ComponentTree;
class TaskPool;
struct Executor;
} // namespace STK

namespace STK::Render {

// Everything a streamed render reports besides the document bytes.
struct RenderReport {
    Hydration::HydrationPayload hydration;
    std::vector<DegradedNode>   degraded;
    SchedulerStats              stats;
    RewriteStats                rewrite;
};

struct RenderOutput {
    std::string                 document;
    Hydration::HydrationPayload hydration;
    std::vector<DegradedNode>   degraded;
    SchedulerStats              stats;
    RewriteStats                rewrite;
};

/**
 * RenderSession — one server-side render of one request.
 *
 * Owns the state registry and the cancellation root for the render; borrows
 * the asset resolver and, optionally, the executor. A session renders once:
 * resolve every bridge, walk the resolved tree, rewrite markers into the
 * sink. cancel() may be called from any thread while a render is running.
 *
 * Servers should keep one Executor (usually a TaskPool) for the process and
 * hand it to every session. The pool-owning constructor and RenderDocument
 * start and join max_concurrent_resolutions threads per render; they suit
 * tools, tests and one-off renders.
 */
class RenderSession {
public:
    // Runs resolutions on `executor`, which must outlive the session.
    RenderSession(RenderConfig config, AssetResolver const& assets, Executor& executor, Bridge::RenderRequest request = {});
    // Runs resolutions on a private TaskPool with max_concurrent_resolutions
    // workers, created and joined with the session.
    RenderSession(RenderConfig config, AssetResolver const& assets, Bridge::RenderRequest request = {});
    ~RenderSession();

    RenderSession(RenderSession const&)            = delete;
    RenderSession& operator=(RenderSession const&) = delete;

    // Buffers the whole document; nothing is returned on error.
    auto render(ComponentTree const& tree, DocumentShell const& shell) -> RenderExpected<RenderOutput>;

    // Streams into `sink`. On error the sink holds a prefix the caller must discard.
    auto render_to(ComponentTree const& tree, DocumentShell const& shell, OutputSink& sink) -> RenderExpected<RenderReport>;

    auto cancel() -> void;

    [[nodiscard]] auto config() const -> RenderConfig const& { return config_; }

private:
    RenderConfig                                 config_;
    AssetResolver const&                         assets_;
    std::unique_ptr<TaskPool>                    owned_pool_;
    Executor&                                    executor_;
    std::shared_ptr<Bridge::RenderRequest const> request_;
    CancellationSource                           cancel_;
    Hydration::StateRegistry                     registry_;
    std::atomic<bool>                            used_{false};
};

// One-shot render on a private pool. Not meant for per-request use in a
// server; construct RenderSession with a shared Executor there.
auto RenderDocument(ComponentTree const&  tree,
                    RenderConfig const&   config,
                    AssetResolver const&  assets,
                    DocumentShell const&  shell   = DocumentShell::Default(),
                    Bridge::RenderRequest request = {}) -> RenderExpected<RenderOutput>;

} // namespace STK::Render
