#include <gtest/gtest.h>

#include "selfupdate/update/release.hpp"
#include "selfupdate/update/release_feed_provider.hpp"
#include "testing.hpp"

#include <filesystem>

namespace selfupdate {
namespace {

Asset NamedAsset(const std::string& name) {
    Asset a;
    a.name = name;
    a.browser_download_url = "assets/" + name;
    return a;
}

const char* kFeed = R"([
  {"tag_name": "v2.0.0-beta.1", "prerelease": true, "published_at": "2025-03-02T10:00:00Z",
   "assets": [{"name": "delta_linux_amd64.tar.gz", "browser_download_url": "b/delta.tar.gz", "size": 10}]},
  {"tag_name": "v1.3.0", "draft": true, "assets": []},
  {"tag_name": "v1.2.0", "name": "Delta 1.2.0", "body": "Fixes", "published_at": "2025-03-01T10:00:00Z",
   "html_url": "https://example.invalid/v1.2.0",
   "assets": [{"name": "delta_darwin_arm64.tar.gz", "browser_download_url": "a/darwin.tar.gz", "size": 11},
              {"name": "delta_linux_amd64.tar.gz", "browser_download_url": "a/linux.tar.gz", "size": 12,
               "digest": "sha256:ABC"}]},
  {"tag_name": "v1.1.0", "assets": null}
])";

TEST(ReleaseTest, ParsesGitHubShapedRelease) {
    std::vector<Release> releases;
    auto r = ParseReleaseFeed(nlohmann::json::parse(kFeed), releases);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    ASSERT_EQ(releases.size(), 4u);

    const Release& rel = releases[2];
    EXPECT_EQ(rel.tag_name, "v1.2.0");
    EXPECT_EQ(rel.name, "Delta 1.2.0");
    EXPECT_EQ(rel.body, "Fixes");
    EXPECT_FALSE(rel.prerelease);
    EXPECT_EQ(FormatRfc3339(rel.published_at), "2025-03-01T10:00:00Z");
    ASSERT_EQ(rel.assets.size(), 2u);
    EXPECT_EQ(rel.assets[1].size, 12u);
    EXPECT_EQ(rel.assets[1].digest, "sha256:ABC");

    EXPECT_TRUE(releases[1].draft);
    EXPECT_TRUE(releases[3].assets.empty());
}

TEST(ReleaseTest, AcceptsWrappedAndSingleReleaseDocuments) {
    std::vector<Release> releases;
    ASSERT_TRUE(ParseReleaseFeed(nlohmann::json::parse(R"({"releases": [{"tag_name": "v1.0.0"}]})"), releases).is_ok());
    ASSERT_EQ(releases.size(), 1u);

    ASSERT_TRUE(ParseReleaseFeed(nlohmann::json::parse(R"({"tag_name": "v1.0.1"})"), releases).is_ok());
    ASSERT_EQ(releases.size(), 1u);
    EXPECT_EQ(releases[0].tag_name, "v1.0.1");
}

TEST(ReleaseTest, RejectsMalformedReleases) {
    std::vector<Release> releases;
    EXPECT_FALSE(ParseReleaseFeed(nlohmann::json::parse(R"([{"name": "no tag"}])"), releases).is_ok());
    EXPECT_FALSE(ParseReleaseFeed(nlohmann::json::parse(R"([{"tag_name": "v1", "assets": {}}])"), releases).is_ok());
    EXPECT_FALSE(ParseReleaseFeed(
        nlohmann::json::parse(R"([{"tag_name": "v1", "published_at": "yesterday"}])"), releases).is_ok());
    EXPECT_FALSE(ParseReleaseFeed(nlohmann::json::parse("42"), releases).is_ok());
}

TEST(AssetSelectionTest, PrefersExactPlatformMatch) {
    const std::vector<Asset> assets = {
        NamedAsset("delta_darwin_amd64.tar.gz"),
        NamedAsset("delta_linux_arm64.tar.gz"),
        NamedAsset("delta_Linux_x86_64.tar.gz"),
    };
    auto a = SelectAssetForPlatform(assets, "linux", "amd64");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->name, "delta_Linux_x86_64.tar.gz");
}

TEST(AssetSelectionTest, FallsBackToOsThenFirst) {
    const std::vector<Asset> assets = {
        NamedAsset("delta_windows_amd64.zip"),
        NamedAsset("delta_macos_universal.tar.gz"),
    };
    auto a = SelectAssetForPlatform(assets, "darwin", "arm64");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->name, "delta_macos_universal.tar.gz");

    a = SelectAssetForPlatform(assets, "linux", "amd64");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->name, "delta_windows_amd64.zip");

    EXPECT_FALSE(SelectAssetForPlatform({}, "linux", "amd64").has_value());
}

class ReleaseFeedProviderTest : public ::testing::Test {
  protected:
    void SetUp() override { testutil::WriteFile(temp_dir.Sub("releases.json"), kFeed); }

    ReleaseFeedProvider MakeProvider(std::string feed) {
        ReleaseFeedProvider::Options opt;
        opt.feed = std::move(feed);
        opt.os = "linux";
        opt.arch = "amd64";
        return ReleaseFeedProvider(opt);
    }

    testutil::TemporaryDirectory temp_dir;
};

TEST_F(ReleaseFeedProviderTest, LatestSkipsDraftsAndHonoursChannel) {
    auto provider = MakeProvider(temp_dir.Path());
    EXPECT_EQ(provider.FeedFile(), temp_dir.Sub("releases.json"));
    EXPECT_EQ(provider.BaseDirectory(), temp_dir.Path());

    auto stable = provider.GetLatestRelease("stable");
    ASSERT_TRUE(stable.has_value()) << stable.error();
    EXPECT_EQ(stable->tag_name, "v1.2.0");

    auto beta = provider.GetLatestRelease("beta");
    ASSERT_TRUE(beta.has_value()) << beta.error();
    EXPECT_EQ(beta->tag_name, "v2.0.0-beta.1");

    EXPECT_FALSE(provider.GetLatestRelease("alpha").has_value());
}

TEST_F(ReleaseFeedProviderTest, LooksUpByTag) {
    auto provider = MakeProvider(temp_dir.Sub("releases.json"));
    EXPECT_EQ(provider.BaseDirectory(), temp_dir.Path());

    auto rel = provider.GetReleaseByTag("v1.1.0");
    ASSERT_TRUE(rel.has_value()) << rel.error();
    EXPECT_EQ(rel->tag_name, "v1.1.0");

    EXPECT_FALSE(provider.GetReleaseByTag("v1.3.0").has_value());
    EXPECT_FALSE(provider.GetReleaseByTag("1.1.0").has_value());
}

TEST_F(ReleaseFeedProviderTest, SelectsAssetForConfiguredPlatform) {
    auto provider = MakeProvider(temp_dir.Path());
    auto rel = provider.GetReleaseByTag("v1.2.0");
    ASSERT_TRUE(rel.has_value());
    auto asset = provider.SelectAssetForPlatform(rel->assets);
    ASSERT_TRUE(asset.has_value());
    EXPECT_EQ(asset->browser_download_url, "a/linux.tar.gz");
}

TEST_F(ReleaseFeedProviderTest, CountsRequestsAndFailures) {
    auto provider = MakeProvider(temp_dir.Path());
    ASSERT_TRUE(provider.GetLatestRelease("stable").has_value());

    std::filesystem::remove(temp_dir.Sub("releases.json"));
    auto missing = provider.GetLatestRelease("stable");
    ASSERT_FALSE(missing.has_value());
    EXPECT_NE(missing.error().find("failed to read release feed"), std::string::npos);

    const auto status = provider.GetRateLimitStatus();
    EXPECT_EQ(status["requests"], 2);
    EXPECT_EQ(status["failures"], 1);
    EXPECT_EQ(status["authenticated"], false);

    provider.SetToken("secret");
    EXPECT_EQ(provider.GetRateLimitStatus()["authenticated"], true);
}

TEST(ReleaseFeedProviderUnconfiguredTest, FailsWithoutFeed) {
    ReleaseFeedProvider provider(ReleaseFeedProvider::Options{});
    auto rel = provider.GetLatestRelease("stable");
    ASSERT_FALSE(rel.has_value());
    EXPECT_NE(rel.error().find("no release feed configured"), std::string::npos);
}

} // namespace
} // namespace selfupdate
