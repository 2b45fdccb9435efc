#include "RenderTestUtils.hpp"

#include <stackable/hydration/StateCodec.hpp>
#include <stackable/hydration/StateRegistry.hpp>
#include <stackable/render/ResolutionScheduler.hpp>
#include <stackable/tree/ComponentTree.hpp>

#include <doctest/doctest.h>

#include <algorithm>
#include <chrono>
#include <thread>

using namespace STK;
using namespace STK::Render;
using namespace STK::Testing;
using namespace std::chrono_literals;

namespace {

auto farDeadline() -> std::chrono::steady_clock::time_point {
    return std::chrono::steady_clock::now() + 10s;
}

auto labelAt(Hydration::StateRegistry const& registry, SlotIndex slot) -> std::string {
    auto const* entry = registry.entry(slot);
    REQUIRE(entry != nullptr);
    auto state = Hydration::decodeState<SlotState>(entry->state);
    REQUIRE(state.has_value());
    return state->label;
}

} // namespace

TEST_SUITE("render.scheduler") {
TEST_CASE("Slots follow pre-order while completions arrive in any order") {
    // A is slower than B; with two workers both start together and B finishes first.
    auto          recorder = std::make_shared<Recorder>();
    ComponentTree tree;
    auto          a    = tree.addBridge("A", delayed("A", 50ms, recorder));
    auto          b    = tree.addBridge("B", delayed("B", 10ms, recorder));
    auto          root = tree.addComposite("<div>", "</div>", {a, b});
    REQUIRE_FALSE(tree.setRoot(root).has_value());

    CountingExecutor         executor(2);
    RenderConfig             config;
    config.max_concurrent_resolutions = 2;
    Hydration::StateRegistry registry;
    ResolutionScheduler      scheduler{executor, config, registry, CancellationToken{}};

    auto result = scheduler.run(tree, farDeadline());
    REQUIRE(result.has_value());
    CHECK(result->stats.discovered == 2);
    CHECK(result->stats.started == 2);
    CHECK(result->stats.resolved == 2);
    CHECK(result->stats.peak_in_flight == 2);
    CHECK(result->degraded.empty());

    auto events = recorder->events();
    auto endA   = std::find(events.begin(), events.end(), "end:A");
    auto endB   = std::find(events.begin(), events.end(), "end:B");
    REQUIRE(endA != events.end());
    REQUIRE(endB != events.end());
    CHECK(endB < endA);

    CHECK(registry.isComplete());
    CHECK(registry.slotFor(a) == std::optional<SlotIndex>{0});
    CHECK(registry.slotFor(b) == std::optional<SlotIndex>{1});
    CHECK(labelAt(registry, 0) == "A");
    CHECK(labelAt(registry, 1) == "B");

    auto const& resolved = result->tree;
    CHECK(resolved.is_former_bridge(a));
    CHECK(resolved.tree().node(a)->asStatic()->markup == "<span>A</span>");
    CHECK(resolved.tree().node(b)->asStatic()->markup == "<span>B</span>");
    // The input tree is left alone.
    CHECK(tree.node(a)->kind() == NodeKind::Bridge);
}

TEST_CASE("In-flight resolutions never exceed the configured maximum") {
    ComponentTree       tree;
    std::vector<NodeId> bridges;
    for (int i = 0; i < 7; ++i)
        bridges.push_back(tree.addBridge("n" + std::to_string(i), delayed("n" + std::to_string(i), 15ms)));
    auto root = tree.addComposite("<ul>", "</ul>", bridges);
    REQUIRE_FALSE(tree.setRoot(root).has_value());

    CountingExecutor         executor(8);
    RenderConfig             config;
    config.max_concurrent_resolutions = 3;
    Hydration::StateRegistry registry;
    ResolutionScheduler      scheduler{executor, config, registry, CancellationToken{}};

    auto result = scheduler.run(tree, farDeadline());
    REQUIRE(result.has_value());
    CHECK(result->stats.peak_in_flight == 3);
    CHECK(result->stats.resolved == 7);
    CHECK(executor.submitted.load() == 7);
    for (SlotIndex slot = 0; slot < 7; ++slot)
        CHECK(labelAt(registry, slot) == "n" + std::to_string(slot));
}

TEST_CASE("A tree without bridges never touches the executor") {
    ComponentTree tree;
    auto          root = tree.addComposite("<p>", "</p>", {tree.addStatic("static only")});
    REQUIRE_FALSE(tree.setRoot(root).has_value());

    CountingExecutor         executor(1);
    RenderConfig             config;
    Hydration::StateRegistry registry;
    ResolutionScheduler      scheduler{executor, config, registry, CancellationToken{}};

    auto result = scheduler.run(tree, farDeadline());
    REQUIRE(result.has_value());
    CHECK(executor.submitted.load() == 0);
    CHECK(result->stats.discovered == 0);
    CHECK(registry.size() == 0);
}

TEST_CASE("A shared bridge resolves once") {
    auto          recorder = std::make_shared<Recorder>();
    ComponentTree tree;
    auto          shared = tree.addBridge("shared", delayed("shared", 1ms, recorder));
    auto          left   = tree.addComposite("<l>", "</l>", {shared});
    auto          right  = tree.addComposite("<r>", "</r>", {shared});
    auto          root   = tree.addComposite("<x>", "</x>", {left, right});
    REQUIRE_FALSE(tree.setRoot(root).has_value());

    InlineExecutor           executor;
    RenderConfig             config;
    Hydration::StateRegistry registry;
    ResolutionScheduler      scheduler{executor, config, registry, CancellationToken{}};

    auto result = scheduler.run(tree, farDeadline());
    REQUIRE(result.has_value());
    CHECK(registry.size() == 1);
    CHECK(result->stats.started == 1);
    CHECK(recorder->events() == std::vector<std::string>{"start:shared", "end:shared"});
}

TEST_CASE("Failures under fail-fast abort the run") {
    ComponentTree tree;
    auto          slow   = tree.addBridge("slow", delayed("slow", 5s));
    auto          broken = tree.addBridge("D", failing(ResolutionError::Code::DependencyFailed, 5ms));
    auto          root   = tree.addComposite("<div>", "</div>", {slow, broken});
    REQUIRE_FALSE(tree.setRoot(root).has_value());

    CountingExecutor         executor(2);
    RenderConfig             config;
    config.max_concurrent_resolutions = 2;
    Hydration::StateRegistry registry;
    ResolutionScheduler      scheduler{executor, config, registry, CancellationToken{}};

    auto started = std::chrono::steady_clock::now();
    auto result  = scheduler.run(tree, farDeadline());
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == RenderError::Code::ResolutionFailed);
    CHECK(result.error().node == std::optional<NodeId>{broken});
    REQUIRE(result.error().resolution.has_value());
    CHECK(result.error().resolution->code == ResolutionError::Code::DependencyFailed);
    // The slow sibling was cancelled rather than awaited.
    CHECK(std::chrono::steady_clock::now() - started < 4s);
    CHECK(scheduler.stats().failed == 1);
    CHECK(scheduler.stats().cancelled == 1);
}

TEST_CASE("Best-effort substitutes fallbacks and reports degraded nodes") {
    ComponentTree tree;
    auto          good    = tree.addBridge("good", immediate("good"));
    auto          custom  = tree.addBridge("custom", failing(ResolutionError::Code::DependencyFailed), std::string{"<i>later</i>"});
    auto          generic = tree.addBridge("generic", failing(ResolutionError::Code::InternalFailure));
    auto          root    = tree.addComposite("<div>", "</div>", {good, custom, generic});
    REQUIRE_FALSE(tree.setRoot(root).has_value());

    InlineExecutor           executor;
    RenderConfig             config;
    config.failure_mode = FailureMode::BestEffort;
    Hydration::StateRegistry registry;
    ResolutionScheduler      scheduler{executor, config, registry, CancellationToken{}};

    auto result = scheduler.run(tree, farDeadline());
    REQUIRE(result.has_value());
    REQUIRE(result->degraded.size() == 2);
    CHECK(result->degraded[0].node == custom);
    CHECK(result->degraded[0].slot == 1);
    CHECK(result->degraded[0].name == "custom");
    CHECK(result->degraded[0].error.code == ResolutionError::Code::DependencyFailed);
    CHECK(result->degraded[1].node == generic);

    CHECK(result->tree.tree().node(custom)->asStatic()->markup == "<i>later</i>");
    CHECK(result->tree.tree().node(generic)->asStatic()->markup == config.fallback_markup);

    auto payload = registry.snapshot();
    REQUIRE(payload.entries.size() == 3);
    CHECK(payload.entries[0].status == static_cast<std::uint8_t>(Hydration::SlotStatus::Resolved));
    CHECK(payload.entries[1].status == static_cast<std::uint8_t>(Hydration::SlotStatus::Degraded));
    CHECK(payload.entries[1].state.empty());
    CHECK(payload.entries[2].status == static_cast<std::uint8_t>(Hydration::SlotStatus::Degraded));
}

TEST_CASE("Per-node timeouts only affect the slow node") {
    ComponentTree tree;
    auto          fast = tree.addBridge("fast", immediate("fast"));
    auto          slow = tree.addBridge("C", delayed("C", 2s));
    auto          root = tree.addComposite("<div>", "</div>", {fast, slow});
    REQUIRE_FALSE(tree.setRoot(root).has_value());

    CountingExecutor         executor(2);
    RenderConfig             config;
    config.failure_mode     = FailureMode::BestEffort;
    config.per_node_timeout = 100ms;
    Hydration::StateRegistry registry;
    ResolutionScheduler      scheduler{executor, config, registry, CancellationToken{}};

    auto result = scheduler.run(tree, farDeadline());
    REQUIRE(result.has_value());
    REQUIRE(result->degraded.size() == 1);
    CHECK(result->degraded[0].node == slow);
    CHECK(result->degraded[0].error.code == ResolutionError::Code::Timeout);
    CHECK(result->stats.timed_out == 1);
    CHECK(result->stats.resolved == 1);
}

TEST_CASE("A timed-out resolution that ignores cancellation keeps its slot until it returns") {
    auto          recorder = std::make_shared<Recorder>();
    ComponentTree tree;
    auto          a    = tree.addBridge("A", stubborn("A", 150ms, {}, recorder));
    auto          b    = tree.addBridge("B", delayed("B", 0ms, recorder));
    auto          root = tree.addComposite("<div>", "</div>", {a, b});
    REQUIRE_FALSE(tree.setRoot(root).has_value());

    CountingExecutor         executor(1);
    RenderConfig             config;
    config.max_concurrent_resolutions = 1;
    config.failure_mode               = FailureMode::BestEffort;
    config.per_node_timeout           = 20ms;
    Hydration::StateRegistry registry;
    ResolutionScheduler      scheduler{executor, config, registry, CancellationToken{}};

    auto result = scheduler.run(tree, farDeadline());
    REQUIRE(result.has_value());
    REQUIRE(result->degraded.size() == 1);
    CHECK(result->degraded[0].node == a);
    CHECK(result->degraded[0].error.code == ResolutionError::Code::Timeout);
    CHECK(result->stats.timed_out == 1);
    CHECK(result->stats.resolved == 1);
    CHECK(result->stats.discarded == 1);
    CHECK(result->stats.peak_in_flight == 1);

    // A's late result is dropped; its slot stays degraded.
    auto const* late = registry.entry(0);
    REQUIRE(late != nullptr);
    REQUIRE(late->status.has_value());
    CHECK(*late->status == Hydration::SlotStatus::Degraded);
    CHECK(late->state.empty());
    CHECK(labelAt(registry, 1) == "B");

    // B was admitted only after A's body returned, and got its own full timeout.
    auto events = recorder->events();
    auto endA   = std::find(events.begin(), events.end(), "end:A");
    auto startB = std::find(events.begin(), events.end(), "start:B");
    REQUIRE(endA != events.end());
    REQUIRE(startB != events.end());
    CHECK(endA < startB);
}

TEST_CASE("Peak in flight matches the resolutions actually running") {
    auto                gauge = std::make_shared<RunningGauge>();
    ComponentTree       tree;
    std::vector<NodeId> bridges;
    for (int i = 0; i < 4; ++i)
        bridges.push_back(tree.addBridge("s" + std::to_string(i), stubborn("s" + std::to_string(i), 120ms, gauge)));
    auto root = tree.addComposite("<ul>", "</ul>", bridges);
    REQUIRE_FALSE(tree.setRoot(root).has_value());

    // More workers than admissions, so only the scheduler can hold the line.
    CountingExecutor         executor(4);
    RenderConfig             config;
    config.max_concurrent_resolutions = 1;
    config.failure_mode               = FailureMode::BestEffort;
    config.per_node_timeout           = 10ms;
    Hydration::StateRegistry registry;
    ResolutionScheduler      scheduler{executor, config, registry, CancellationToken{}};

    auto result = scheduler.run(tree, farDeadline());
    REQUIRE(result.has_value());
    CHECK(result->stats.timed_out == 4);
    CHECK(result->degraded.size() == 4);
    CHECK(result->stats.peak_in_flight == 1);
    CHECK(gauge->peak() == 1);
    // Every late completion but the last arrives while the run still waits on it.
    CHECK(result->stats.discarded == 3);
}

TEST_CASE("The global deadline ends the run") {
    ComponentTree tree;
    auto          slow = tree.addBridge("slow", delayed("slow", 5s));
    REQUIRE_FALSE(tree.setRoot(slow).has_value());

    CountingExecutor         executor(1);
    RenderConfig             config;
    Hydration::StateRegistry registry;
    ResolutionScheduler      scheduler{executor, config, registry, CancellationToken{}};

    auto result = scheduler.run(tree, std::chrono::steady_clock::now() + 30ms);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == RenderError::Code::SessionTimeout);
    CHECK(scheduler.stats().cancelled == 1);
}

TEST_CASE("Session cancellation ends the run") {
    ComponentTree tree;
    auto          slow = tree.addBridge("slow", delayed("slow", 5s));
    REQUIRE_FALSE(tree.setRoot(slow).has_value());

    CountingExecutor         executor(1);
    RenderConfig             config;
    Hydration::StateRegistry registry;
    CancellationSource       session;
    ResolutionScheduler      scheduler{executor, config, registry, session.token()};

    std::jthread canceller([&session] {
        std::this_thread::sleep_for(20ms);
        session.cancel();
    });
    auto result = scheduler.run(tree, farDeadline());
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == RenderError::Code::SessionCancelled);
}

TEST_CASE("Invalid trees are rejected before anything starts") {
    ComponentTree tree;
    auto          bridge = tree.addBridge("b", immediate("b"));
    auto          loop   = tree.addComposite("<a>", "</a>", {bridge});
    REQUIRE_FALSE(tree.appendChild(loop, loop).has_value());
    REQUIRE_FALSE(tree.setRoot(loop).has_value());

    CountingExecutor         executor(1);
    RenderConfig             config;
    Hydration::StateRegistry registry;
    ResolutionScheduler      scheduler{executor, config, registry, CancellationToken{}};

    auto result = scheduler.run(tree, farDeadline());
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == RenderError::Code::InvalidTree);
    CHECK(executor.submitted.load() == 0);
    CHECK(registry.size() == 0);

    auto again = scheduler.run(tree, farDeadline());
    REQUIRE_FALSE(again.has_value());
    CHECK(again.error().code == RenderError::Code::InternalFailure);
}
}
