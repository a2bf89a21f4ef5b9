#include "selfupdate/update/release_feed_provider.hpp"

#include "selfupdate/update/version.hpp"
#include "selfupdate/util/json_utils.hpp"
#include "selfupdate/util/logger.hpp"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace selfupdate {

ReleaseFeedProvider::ReleaseFeedProvider(Options opt) : opt_(std::move(opt)) {
    if (opt_.max_releases == 0) opt_.max_releases = 10;
}

std::string ReleaseFeedProvider::FeedFile() const {
    std::error_code ec;
    if (fs::is_directory(opt_.feed, ec)) {
        return (fs::path(opt_.feed) / "releases.json").string();
    }
    return opt_.feed;
}

std::string ReleaseFeedProvider::BaseDirectory() const {
    std::error_code ec;
    if (fs::is_directory(opt_.feed, ec)) return opt_.feed;
    const auto parent = fs::path(opt_.feed).parent_path();
    return parent.empty() ? std::string(".") : parent.string();
}

Result ReleaseFeedProvider::LoadFeed(std::vector<Release>& out) {
    if (opt_.feed.empty()) {
        return Result::Fail(EINVAL, "no release feed configured");
    }

    const std::string path = FeedFile();
    nlohmann::json doc;
    auto r = jsonutil::LoadJsonFromFile(path, doc);
    if (r.is_ok()) r = ParseReleaseFeed(doc, out);

    std::lock_guard<std::mutex> lk(mu_);
    ++requests_;
    if (!r.is_ok()) {
        ++failures_;
        return Result::Fail(r.err, "failed to read release feed: " + r.msg);
    }
    LogDebug("Loaded %zu releases from %s", out.size(), path.c_str());
    return Result::Ok();
}

std::expected<Release, std::string> ReleaseFeedProvider::GetLatestRelease(const std::string& channel) {
    std::vector<Release> releases;
    auto r = LoadFeed(releases);
    if (!r.is_ok()) return std::unexpected(r.msg);

    const size_t n = std::min(releases.size(), opt_.max_releases);
    for (size_t i = 0; i < n; ++i) {
        const auto& rel = releases[i];
        if (rel.draft) continue;
        if (MatchesChannel(GetVersionFromTag(rel.tag_name), channel)) return rel;
    }
    return std::unexpected("no release found for channel: " + channel);
}

std::expected<Release, std::string> ReleaseFeedProvider::GetReleaseByTag(const std::string& tag) {
    std::vector<Release> releases;
    auto r = LoadFeed(releases);
    if (!r.is_ok()) return std::unexpected(r.msg);

    for (const auto& rel : releases) {
        if (!rel.draft && rel.tag_name == tag) return rel;
    }
    return std::unexpected("release not found: " + tag);
}

std::expected<Asset, std::string> ReleaseFeedProvider::SelectAssetForPlatform(
    const std::vector<Asset>& assets) const {
    return selfupdate::SelectAssetForPlatform(assets, opt_.os, opt_.arch);
}

nlohmann::json ReleaseFeedProvider::GetRateLimitStatus() const {
    std::lock_guard<std::mutex> lk(mu_);
    return nlohmann::json{
        {"source", FeedFile()},
        {"unlimited", true},
        {"authenticated", !token_.empty()},
        {"requests", requests_},
        {"failures", failures_},
    };
}

void ReleaseFeedProvider::SetToken(const std::string& token) {
    std::lock_guard<std::mutex> lk(mu_);
    token_ = token;
}

} // namespace selfupdate
