#include <stackable/render/DocumentShell.hpp>

namespace STK::Render {

auto DocumentShell::Parse(std::string_view html) -> Expected<DocumentShell> {
    std::vector<MarkupChunk> chunks;
    SplitMarkers(html, std::nullopt, chunks);

    DocumentShell shell;
    bool          seen_body = false;
    for (auto& chunk : chunks) {
        if (chunk.marker == MarkerKind::Body) {
            if (seen_body) {
                return std::unexpected(Error{Error::Code::MalformedInput, "document shell has more than one body marker"});
            }
            seen_body = true;
            continue;
        }
        (seen_body ? shell.suffix_ : shell.prefix_).push_back(std::move(chunk));
    }
    if (!seen_body) {
        return std::unexpected(Error{Error::Code::MalformedInput, "document shell has no <!--stk:body--> marker"});
    }
    return shell;
}

auto DocumentShell::Default() -> DocumentShell {
    // The built-in template always parses.
    return *Parse(DefaultShellHtml);
}

} // namespace STK::Render
