#pragma once

#include "selfupdate/util/result.hpp"
#include "selfupdate/util/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace selfupdate {

struct Asset {
    std::string name;
    std::string browser_download_url;
    std::uint64_t size = 0;
    std::string content_type;
    // "sha256:<hex>" when the feed publishes one.
    std::string digest;
};

struct Release {
    std::string tag_name;
    std::string name;
    std::string body;
    bool prerelease = false;
    bool draft = false;
    TimePoint published_at{};
    std::string html_url;
    std::vector<Asset> assets;
};

// Field names follow the GitHub releases API.
Result ParseRelease(const nlohmann::json& j, Release& out);

// Accepts a JSON array of releases, an object with a "releases" array, or a
// single release object.
Result ParseReleaseFeed(const nlohmann::json& j, std::vector<Release>& out);

// Exact OS+arch match, then OS-only match, then the first asset. Fails only
// when `assets` is empty.
std::expected<Asset, std::string> SelectAssetForPlatform(const std::vector<Asset>& assets,
                                                         std::string_view os,
                                                         std::string_view arch);

} // namespace selfupdate
