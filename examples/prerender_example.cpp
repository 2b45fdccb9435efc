#include <stackable/Stackable.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

using namespace STK;
using namespace STK::Render;

namespace {

struct Forecast {
    std::string  city;
    std::int32_t celsius;
};

struct Headlines {
    std::vector<std::string> titles;
};

auto forecast_bridge() -> std::shared_ptr<Bridge::Resolvable> {
    return Bridge::makeResolvable<Forecast>(
        [](Bridge::ResolutionContext const& context) -> ResolutionExpected<Forecast> {
            // Stand-in for an upstream weather call.
            if (context.token.waitFor(std::chrono::milliseconds{40}))
                return std::unexpected(ResolutionError{ResolutionError::Code::Cancelled});
            return Forecast{"Oslo", 7};
        },
        [](Forecast const& forecast) {
            return "<section class=\"forecast\">" + forecast.city + ": " + std::to_string(forecast.celsius) + "&deg;C</section>";
        },
        [](Forecast const& forecast) {
            return std::vector<std::string>{"<title>Weather in " + forecast.city + "</title>"};
        });
}

auto headlines_bridge() -> std::shared_ptr<Bridge::Resolvable> {
    return Bridge::makeResolvable<Headlines>(
        [](Bridge::ResolutionContext const& context) -> ResolutionExpected<Headlines> {
            if (context.token.waitFor(std::chrono::milliseconds{15}))
                return std::unexpected(ResolutionError{ResolutionError::Code::Cancelled});
            return Headlines{{"Fjord ferry resumes", "Snow expected on Friday"}};
        },
        [](Headlines const& headlines) {
            std::string markup = "<ul class=\"headlines\">";
            for (auto const& title : headlines.titles)
                markup += "<li>" + title + "</li>";
            return markup + "</ul>";
        });
}

constexpr std::string_view ShellHtml =
        "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\"><!--stk:head-->"
        "<link rel=\"stylesheet\" href=\"<!--stk:asset:site.css-->\"></head>"
        "<body><div id=\"stk-root\"><!--stk:body--></div><!--stk:hydration-->"
        "<script src=\"<!--stk:asset:client.js-->\"></script></body></html>";

} // namespace

int main() {
#ifdef STK_LOG_DEBUG
    configure_logging_from_env();
    set_thread_name("Main");
#endif

    RenderConfig config;
    if (!ApplyRenderEnvOverrides(config))
        return 1;

    auto assets = ManifestAssetResolver::FromJson(R"({"site.css": "site.3f9a.css", "client.js": "client.81bc.js"})", "/assets");
    if (!assets) {
        std::cerr << "asset manifest: " << describeError(assets.error()) << "\n";
        return 1;
    }

    auto shell = DocumentShell::Parse(ShellHtml);
    if (!shell) {
        std::cerr << "shell: " << describeError(shell.error()) << "\n";
        return 1;
    }

    ComponentTree tree;
    auto          header    = tree.addStatic("<header><h1>Today</h1></header>");
    auto          weather   = tree.addBridge("forecast", forecast_bridge(), "<section class=\"forecast\">unavailable</section>");
    auto          headlines = tree.addBridge("headlines", headlines_bridge());
    auto          main_node = tree.addComposite("<main>", "</main>", {header, weather, headlines});
    if (auto err = tree.setRoot(main_node)) {
        std::cerr << "tree: " << describeError(*err) << "\n";
        return 1;
    }

    auto output = RenderDocument(tree, config, *assets, *shell, Bridge::RenderRequest{"/today", ""});
    if (!output) {
        std::cerr << "render: " << describeError(output.error()) << "\n";
        return 1;
    }

    std::cout << output->document << "\n";
    std::cerr << SerializeRenderOutput(*output).dump(2) << "\n";

#ifdef STK_LOG_DEBUG
    logger().flush();
#endif
    return 0;
}
