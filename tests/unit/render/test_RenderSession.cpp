#include "RenderTestUtils.hpp"

#include <stackable/hydration/HydrationPayload.hpp>
#include <stackable/hydration/StateCodec.hpp>
#include <stackable/render/RenderReportJson.hpp>
#include <stackable/render/RenderSession.hpp>
#include <stackable/tree/ComponentTree.hpp>

#include <doctest/doctest.h>

#include <chrono>
#include <string>
#include <thread>

using namespace STK;
using namespace STK::Render;
using namespace STK::Testing;
using namespace std::chrono_literals;

namespace {

constexpr std::string_view Shell = "<!DOCTYPE html><html><head><!--stk:head--><script src=\"<!--stk:asset:app.js-->\"></script></head>"
                                   "<body><!--stk:body--><!--stk:hydration--></body></html>";

auto assets() -> ManifestAssetResolver {
    ManifestAssetResolver resolver{"/static"};
    auto                  err = resolver.add("app.js", "app-7d2e.js");
    REQUIRE_FALSE(err.has_value());
    return resolver;
}

auto shell() -> DocumentShell {
    auto parsed = DocumentShell::Parse(Shell);
    REQUIRE(parsed.has_value());
    return std::move(*parsed);
}

// Extracts and decodes the inline payload script from a rendered document.
auto payloadIn(std::string const& document) -> Hydration::HydrationPayload {
    auto open = document.find("id=\"stk-hydration\"");
    REQUIRE(open != std::string::npos);
    auto start = document.find('>', open);
    auto end   = document.find("</script>", start);
    REQUIRE(start != std::string::npos);
    REQUIRE(end != std::string::npos);
    auto bytes = Hydration::decodeBase64(std::string_view{document}.substr(start + 1, end - start - 1));
    REQUIRE(bytes.has_value());
    auto payload = Hydration::decodePayload(*bytes);
    REQUIRE(payload.has_value());
    return *payload;
}

auto twoBridgeTree(std::chrono::milliseconds delayA, std::chrono::milliseconds delayB) -> ComponentTree {
    ComponentTree tree;
    auto          a    = tree.addBridge("A", delayed("A", delayA, {}, {"<title>A</title>"}));
    auto          b    = tree.addBridge("B", delayed("B", delayB, {}, {"<meta name=\"b\">"}));
    auto          root = tree.addComposite("<div id=\"app\">", "</div>", {a, b});
    REQUIRE_FALSE(tree.setRoot(root).has_value());
    return tree;
}

} // namespace

TEST_SUITE("render.session") {
TEST_CASE("Full render with concurrent bridges") {
    auto             tree     = twoBridgeTree(50ms, 10ms);
    auto             resolver = assets();
    CountingExecutor executor(2);
    RenderConfig     config;
    config.max_concurrent_resolutions = 2;

    RenderSession session{config, resolver, executor};
    auto          output = session.render(tree, shell());
    REQUIRE(output.has_value());

    auto const& document = output->document;
    CHECK(document.starts_with("<!DOCTYPE html><html><head><title>A</title><meta name=\"b\">"
                               "<script src=\"/static/app-7d2e.js\"></script></head>"
                               "<body><div id=\"app\"><span>A</span><span>B</span></div><script type=\"application/octet-stream\""));
    CHECK(document.ends_with("</script></body></html>"));
    CHECK(document.find("<!--stk:") == std::string::npos);

    CHECK(output->stats.peak_in_flight == 2);
    CHECK(output->degraded.empty());
    REQUIRE(output->hydration.entries.size() == 2);
    CHECK(output->hydration.entries[0].slot == 0);
    CHECK(output->hydration.entries[1].slot == 1);
    CHECK(Hydration::decodeState<SlotState>(output->hydration.entries[0].state)->label == "A");
    CHECK(Hydration::decodeState<SlotState>(output->hydration.entries[1].state)->label == "B");
    CHECK(payloadIn(document) == output->hydration);
    CHECK(output->rewrite.bytes_written == document.size());
}

TEST_CASE("Sessions can share one executor") {
    auto             tree     = twoBridgeTree(1ms, 1ms);
    auto             resolver = assets();
    CountingExecutor executor(2);

    for (int i = 0; i < 2; ++i) {
        RenderSession session{RenderConfig{}, resolver, executor};
        auto          output = session.render(tree, shell());
        REQUIRE(output.has_value());
        CHECK(output->hydration.entries.size() == 2);
    }
    CHECK(executor.submitted.load() == 4);
}

TEST_CASE("Rendering the same tree twice gives identical bytes") {
    auto tree     = twoBridgeTree(15ms, 1ms);
    auto resolver = assets();

    auto first  = RenderDocument(tree, RenderConfig{}, resolver, shell());
    auto second = RenderDocument(tree, RenderConfig{}, resolver, shell());
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first->document == second->document);
    CHECK(first->hydration == second->hydration);

    auto firstBytes  = Hydration::encodePayload(first->hydration);
    auto secondBytes = Hydration::encodePayload(second->hydration);
    REQUIRE(firstBytes.has_value());
    REQUIRE(secondBytes.has_value());
    CHECK(*firstBytes == *secondBytes);
}

TEST_CASE("Zero bridges render without the executor") {
    ComponentTree tree;
    auto          root = tree.addStatic("<p>static page</p>");
    REQUIRE_FALSE(tree.setRoot(root).has_value());

    auto             resolver = assets();
    CountingExecutor executor(1);
    RenderSession    session{RenderConfig{}, resolver, executor};
    auto             output = session.render(tree, shell());
    REQUIRE(output.has_value());
    CHECK(executor.submitted.load() == 0);
    CHECK(output->hydration.entries.empty());
    CHECK(output->document.find("<p>static page</p>") != std::string::npos);
    CHECK(output->document.find("data-slots=\"0\"") != std::string::npos);
}

TEST_CASE("A slow node degrades under best-effort") {
    ComponentTree tree;
    auto          intro = tree.addStatic("<h1>Forecast</h1>");
    auto          c     = tree.addBridge("C", delayed("C", 2s));
    auto          root  = tree.addComposite("<main>", "</main>", {intro, c});
    REQUIRE_FALSE(tree.setRoot(root).has_value());

    auto         resolver = assets();
    RenderConfig config;
    config.failure_mode     = FailureMode::BestEffort;
    config.per_node_timeout = 5ms;

    RenderSession session{config, resolver};
    auto          output = session.render(tree, shell());
    REQUIRE(output.has_value());
    CHECK(output->document.find("<main><h1>Forecast</h1><template data-stk-fallback></template></main>") != std::string::npos);
    REQUIRE(output->degraded.size() == 1);
    CHECK(output->degraded[0].node == c);
    CHECK(output->degraded[0].error.code == ResolutionError::Code::Timeout);
    REQUIRE(output->hydration.entries.size() == 1);
    CHECK(output->hydration.entries[0].status == static_cast<std::uint8_t>(Hydration::SlotStatus::Degraded));
}

TEST_CASE("A dependency failure under fail-fast yields no document") {
    ComponentTree tree;
    auto          ok   = tree.addBridge("ok", immediate("ok"));
    auto          d    = tree.addBridge("D", failing(ResolutionError::Code::DependencyFailed));
    auto          root = tree.addComposite("<div>", "</div>", {ok, d});
    REQUIRE_FALSE(tree.setRoot(root).has_value());

    auto resolver = assets();
    auto output   = RenderDocument(tree, RenderConfig{}, resolver, shell());
    REQUIRE_FALSE(output.has_value());
    CHECK(output.error().code == RenderError::Code::ResolutionFailed);
    CHECK(output.error().node == std::optional<NodeId>{d});
    REQUIRE(output.error().resolution.has_value());
    CHECK(output.error().resolution->code == ResolutionError::Code::DependencyFailed);
}

TEST_CASE("Shell problems surface as RewriteFailed") {
    ComponentTree tree;
    auto          root = tree.addStatic("<p>x</p>");
    REQUIRE_FALSE(tree.setRoot(root).has_value());
    auto resolver = assets();

    SUBCASE("No hydration marker") {
        auto noHydration = DocumentShell::Parse("<html><body><!--stk:body--></body></html>");
        REQUIRE(noHydration.has_value());
        auto output = RenderDocument(tree, RenderConfig{}, resolver, *noHydration);
        REQUIRE_FALSE(output.has_value());
        CHECK(output.error().code == RenderError::Code::RewriteFailed);
    }
    SUBCASE("Unknown asset") {
        auto unknown = DocumentShell::Parse("<!--stk:asset:nope.js--><!--stk:body--><!--stk:hydration-->");
        REQUIRE(unknown.has_value());
        auto output = RenderDocument(tree, RenderConfig{}, resolver, *unknown);
        REQUIRE_FALSE(output.has_value());
        CHECK(output.error().code == RenderError::Code::RewriteFailed);
    }
}

TEST_CASE("Streaming render reports through the sink") {
    auto          tree     = twoBridgeTree(1ms, 1ms);
    auto          resolver = assets();
    RenderConfig  config;
    config.flush_threshold = 16;
    RenderSession session{config, resolver};
    RecordingSink sink;

    auto report = session.render_to(tree, shell(), sink);
    REQUIRE(report.has_value());
    CHECK(sink.writes.size() > 1);
    CHECK(report->rewrite.peak_buffered <= 16);
    CHECK(payloadIn(sink.joined()) == report->hydration);

    auto json = SerializeRenderReport(*report);
    CHECK(json["slots"] == 2);
    CHECK(json["resolved_slots"] == 2);
    CHECK(json["degraded"].empty());
    CHECK(json["scheduler"]["resolved"] == 2);
    CHECK(json["rewrite"]["bytes_written"] == sink.joined().size());
}

TEST_CASE("Sessions are single use") {
    auto          tree     = twoBridgeTree(1ms, 1ms);
    auto          resolver = assets();
    RenderSession session{RenderConfig{}, resolver};
    REQUIRE(session.render(tree, shell()).has_value());

    auto again = session.render(tree, shell());
    REQUIRE_FALSE(again.has_value());
    CHECK(again.error().code == RenderError::Code::InternalFailure);
}

TEST_CASE("Invalid configuration and trees are reported") {
    auto resolver = assets();

    SUBCASE("Config") {
        auto         tree = twoBridgeTree(1ms, 1ms);
        RenderConfig config;
        config.flush_threshold = 0;
        CountingExecutor executor(1);
        RenderSession    session{config, resolver, executor};
        auto             output = session.render(tree, shell());
        REQUIRE_FALSE(output.has_value());
        CHECK(output.error().code == RenderError::Code::InvalidConfig);
        CHECK(executor.submitted.load() == 0);
    }
    SUBCASE("Tree without a root") {
        ComponentTree tree;
        tree.addStatic("orphan");
        auto output = RenderDocument(tree, RenderConfig{}, resolver, shell());
        REQUIRE_FALSE(output.has_value());
        CHECK(output.error().code == RenderError::Code::InvalidTree);
    }
}

TEST_CASE("Global timeout and cancellation end the session") {
    ComponentTree tree;
    auto          slow = tree.addBridge("slow", delayed("slow", 5s));
    REQUIRE_FALSE(tree.setRoot(slow).has_value());
    auto resolver = assets();

    SUBCASE("Timeout") {
        RenderConfig config;
        config.global_timeout = 40ms;
        auto output           = RenderDocument(tree, config, resolver, shell());
        REQUIRE_FALSE(output.has_value());
        CHECK(output.error().code == RenderError::Code::SessionTimeout);
        auto json = render_error_to_json(output.error());
        CHECK(json["code"] == "session_timeout");
    }
    SUBCASE("Cancel") {
        RenderSession session{RenderConfig{}, resolver};
        std::jthread  canceller([&session] {
            std::this_thread::sleep_for(20ms);
            session.cancel();
        });
        auto output = session.render(tree, shell());
        REQUIRE_FALSE(output.has_value());
        CHECK(output.error().code == RenderError::Code::SessionCancelled);
    }
}

TEST_CASE("Render requests reach every resolution") {
    class PathEcho final : public Bridge::Resolvable {
    public:
        auto resolve(Bridge::ResolutionContext const& context) -> ResolutionExpected<Bridge::ResolvedState> override {
            Bridge::ResolvedState state;
            state.markup = "<p>" + context.request->path + "</p>";
            return state;
        }
    };

    ComponentTree tree;
    auto          root = tree.addBridge("path", std::make_shared<PathEcho>());
    REQUIRE_FALSE(tree.setRoot(root).has_value());
    auto resolver = assets();

    auto output = RenderDocument(tree, RenderConfig{}, resolver, shell(), Bridge::RenderRequest{"/blog/42", ""});
    REQUIRE(output.has_value());
    CHECK(output->document.find("<p>/blog/42</p>") != std::string::npos);
}
}
