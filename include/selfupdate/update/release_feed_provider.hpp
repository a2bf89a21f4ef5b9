#pragma once

#include "selfupdate/update/build_info.hpp"
#include "selfupdate/update/release_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

namespace selfupdate {

// Reads releases from a GitHub-API shaped JSON document on disk: either the
// file itself or a directory holding `releases.json`. The feed is re-read on
// every call so a long-running daemon sees new releases.
class ReleaseFeedProvider final : public IReleaseProvider {
  public:
    struct Options {
        std::string feed;
        std::string os = CurrentOs();
        std::string arch = CurrentArch();
        // Only the newest entries are considered for "latest".
        size_t max_releases = 10;
    };

    explicit ReleaseFeedProvider(Options opt);

    std::expected<Release, std::string> GetLatestRelease(const std::string& channel) override;
    std::expected<Release, std::string> GetReleaseByTag(const std::string& tag) override;
    std::expected<Asset, std::string> SelectAssetForPlatform(
        const std::vector<Asset>& assets) const override;
    nlohmann::json GetRateLimitStatus() const override;
    void SetToken(const std::string& token) override;

    // Path of the JSON document actually read.
    std::string FeedFile() const;
    // Directory relative asset URLs are resolved against.
    std::string BaseDirectory() const;

  private:
    Result LoadFeed(std::vector<Release>& out);

    Options opt_;
    mutable std::mutex mu_;
    std::string token_;
    std::uint64_t requests_ = 0;
    std::uint64_t failures_ = 0;
};

} // namespace selfupdate
