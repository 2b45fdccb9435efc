#pragma once
#include <stackable/core/Error.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace STK::Render {

// Maps the NAME of an <!--stk:asset:NAME--> marker to the URL written in its place.
class AssetResolver {
public:
    virtual ~AssetResolver() = default;

    virtual auto resolve(std::string_view name) const -> std::optional<std::string> = 0;
};

// Relative path of one or more components made of letters, digits, '_', '-', '.'.
bool IsAssetName(std::string_view value);

/**
 * ManifestAssetResolver — lookup table built from the bundler's manifest, a
 * JSON object of {"name": "reference"}. Relative references are joined to
 * the base URL; absolute URLs and root-relative paths are used as they are.
 */
class ManifestAssetResolver final : public AssetResolver {
public:
    explicit ManifestAssetResolver(std::string base_url = {});

    static auto FromJson(std::string_view manifest, std::string base_url = {}) -> Expected<ManifestAssetResolver>;

    auto add(std::string name, std::string reference) -> std::optional<Error>;
    auto resolve(std::string_view name) const -> std::optional<std::string> override;

    [[nodiscard]] auto size() const -> std::size_t { return assets_.size(); }

private:
    std::string                                      base_url_;
    phmap::flat_hash_map<std::string, std::string>   assets_;
};

} // namespace STK::Render
