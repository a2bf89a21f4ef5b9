#pragma once

#include "selfupdate/update/release.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <string>
#include <vector>

namespace selfupdate {

// Source of published releases.
class IReleaseProvider {
  public:
    virtual ~IReleaseProvider() = default;

    // Newest non-draft release whose version matches `channel`.
    virtual std::expected<Release, std::string> GetLatestRelease(const std::string& channel) = 0;
    virtual std::expected<Release, std::string> GetReleaseByTag(const std::string& tag) = 0;
    virtual std::expected<Asset, std::string> SelectAssetForPlatform(
        const std::vector<Asset>& assets) const = 0;
    virtual nlohmann::json GetRateLimitStatus() const = 0;
    virtual void SetToken(const std::string& token) = 0;
};

} // namespace selfupdate
