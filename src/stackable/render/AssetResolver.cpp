#include <stackable/render/AssetResolver.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace STK::Render {

using json = nlohmann::json;

namespace {

bool is_asset_component(std::string_view value) {
    if (value.empty() || value == "." || value == "..") {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isalnum(ch) != 0 || ch == '_' || ch == '-' || ch == '.';
    });
}

bool is_absolute_reference(std::string_view value) {
    return value.starts_with("http://") || value.starts_with("https://") || value.starts_with("//")
           || value.starts_with("/");
}

} // namespace

bool IsAssetName(std::string_view value) {
    if (value.empty() || value.front() == '/') {
        return false;
    }
    std::size_t offset = 0;
    while (offset <= value.size()) {
        auto             next    = value.find('/', offset);
        std::string_view segment = next == std::string_view::npos ? value.substr(offset) : value.substr(offset, next - offset);
        if (!is_asset_component(segment)) {
            return false;
        }
        if (next == std::string_view::npos) {
            break;
        }
        offset = next + 1;
    }
    return true;
}

ManifestAssetResolver::ManifestAssetResolver(std::string base_url)
    : base_url_(std::move(base_url)) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

auto ManifestAssetResolver::FromJson(std::string_view manifest, std::string base_url) -> Expected<ManifestAssetResolver> {
    auto parsed = json::parse(manifest, nullptr, false);
    if (parsed.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "asset manifest is not valid JSON"});
    }
    if (!parsed.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "asset manifest must be a JSON object"});
    }
    ManifestAssetResolver resolver{std::move(base_url)};
    for (auto const& [name, reference] : parsed.items()) {
        if (!reference.is_string()) {
            return std::unexpected(Error{Error::Code::MalformedInput, "asset '" + name + "' must map to a string"});
        }
        if (auto err = resolver.add(name, reference.get<std::string>())) {
            return std::unexpected(*err);
        }
    }
    return resolver;
}

auto ManifestAssetResolver::add(std::string name, std::string reference) -> std::optional<Error> {
    if (!IsAssetName(name)) {
        return Error{Error::Code::MalformedInput, "invalid asset name '" + name + "'"};
    }
    if (reference.empty()) {
        return Error{Error::Code::MalformedInput, "asset '" + name + "' has an empty reference"};
    }
    assets_.insert_or_assign(std::move(name), std::move(reference));
    return std::nullopt;
}

auto ManifestAssetResolver::resolve(std::string_view name) const -> std::optional<std::string> {
    auto it = assets_.find(std::string{name});
    if (it == assets_.end()) {
        return std::nullopt;
    }
    auto const& reference = it->second;
    if (is_absolute_reference(reference)) {
        return reference;
    }
    return base_url_ + "/" + reference;
}

} // namespace STK::Render
