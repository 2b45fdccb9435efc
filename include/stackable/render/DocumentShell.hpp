#pragma once
#include <stackable/core/Error.hpp>
#include <stackable/render/MarkupChunk.hpp>

#include <string_view>
#include <vector>

namespace STK::Render {

inline constexpr std::string_view DefaultShellHtml =
    "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\"><!--stk:head--></head>"
    "<body><div id=\"stk-root\"><!--stk:body--></div><!--stk:hydration--></body></html>";

/**
 * DocumentShell — the index.html template a rendered tree is placed into.
 * The single <!--stk:body--> marker splits it into the chunks rendered
 * before and after the tree; all other markers are kept for the rewriter.
 */
class DocumentShell {
public:
    static auto Parse(std::string_view html) -> Expected<DocumentShell>;
    static auto Default() -> DocumentShell;

    [[nodiscard]] auto prefix() const -> std::vector<MarkupChunk> const& { return prefix_; }
    [[nodiscard]] auto suffix() const -> std::vector<MarkupChunk> const& { return suffix_; }

private:
    DocumentShell() = default;

    std::vector<MarkupChunk> prefix_;
    std::vector<MarkupChunk> suffix_;
};

} // namespace STK::Render
