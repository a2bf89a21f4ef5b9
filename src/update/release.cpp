#include "selfupdate/update/release.hpp"

#include "selfupdate/util/json_utils.hpp"
#include "selfupdate/util/path_utils.hpp"

#include <span>

namespace selfupdate {

using namespace jsonutil;

namespace {

Result ParseAsset(const nlohmann::json& j, Asset& out) {
    if (!j.is_object()) return Result::Fail(-1, "asset must be a JSON object");
    if (!GetStringIfPresent(j, "name", out.name) || out.name.empty()) {
        return Result::Fail(-1, "asset is missing 'name'");
    }
    GetStringIfPresent(j, "browser_download_url", out.browser_download_url);
    GetU64IfPresent(j, "size", out.size);
    GetStringIfPresent(j, "content_type", out.content_type);
    GetStringIfPresent(j, "digest", out.digest);
    return Result::Ok();
}

constexpr std::string_view kLinuxNames[] = {"linux"};
constexpr std::string_view kDarwinNames[] = {"darwin", "macos", "mac"};
constexpr std::string_view kWindowsNames[] = {"windows", "win"};

constexpr std::string_view kAmd64Names[] = {"amd64", "x86_64", "x64"};
constexpr std::string_view kArm64Names[] = {"arm64", "aarch64"};
constexpr std::string_view k386Names[] = {"386", "i386", "x86"};

std::span<const std::string_view> OsAliases(std::string_view os) {
    if (os == "linux") return kLinuxNames;
    if (os == "darwin") return kDarwinNames;
    if (os == "windows") return kWindowsNames;
    return {};
}

std::span<const std::string_view> ArchAliases(std::string_view arch) {
    if (arch == "amd64") return kAmd64Names;
    if (arch == "arm64") return kArm64Names;
    if (arch == "386") return k386Names;
    return {};
}

bool ContainsAny(const std::string& haystack, std::span<const std::string_view> needles) {
    for (auto n : needles) {
        if (haystack.find(n) != std::string::npos) return true;
    }
    return false;
}

} // namespace

Result ParseRelease(const nlohmann::json& j, Release& out) {
    if (!j.is_object()) return Result::Fail(-1, "release must be a JSON object");
    if (!GetStringIfPresent(j, "tag_name", out.tag_name) || out.tag_name.empty()) {
        return Result::Fail(-1, "release is missing 'tag_name'");
    }
    GetStringIfPresent(j, "name", out.name);
    GetStringIfPresent(j, "body", out.body);
    GetBoolIfPresent(j, "prerelease", out.prerelease);
    GetBoolIfPresent(j, "draft", out.draft);
    GetStringIfPresent(j, "html_url", out.html_url);

    std::string published;
    if (GetStringIfPresent(j, "published_at", published) && !published.empty()) {
        if (!ParseRfc3339(published, out.published_at)) {
            return Result::Fail(-1, "release " + out.tag_name + " has invalid published_at: " + published);
        }
    }

    out.assets.clear();
    if (auto it = j.find("assets"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) return Result::Fail(-1, "release " + out.tag_name + ": 'assets' must be an array");
        for (const auto& item : *it) {
            Asset a;
            auto r = ParseAsset(item, a);
            if (!r.is_ok()) return Result::Fail(r.err, "release " + out.tag_name + ": " + r.msg);
            out.assets.push_back(std::move(a));
        }
    }
    return Result::Ok();
}

Result ParseReleaseFeed(const nlohmann::json& j, std::vector<Release>& out) {
    out.clear();

    const nlohmann::json* arr = &j;
    if (j.is_object()) {
        auto it = j.find("releases");
        if (it == j.end()) {
            Release single;
            auto r = ParseRelease(j, single);
            if (!r.is_ok()) return r;
            out.push_back(std::move(single));
            return Result::Ok();
        }
        arr = &*it;
    }
    if (!arr->is_array()) return Result::Fail(-1, "release feed must be a JSON array");

    out.reserve(arr->size());
    for (const auto& item : *arr) {
        Release rel;
        auto r = ParseRelease(item, rel);
        if (!r.is_ok()) return r;
        out.push_back(std::move(rel));
    }
    return Result::Ok();
}

std::expected<Asset, std::string> SelectAssetForPlatform(const std::vector<Asset>& assets,
                                                         std::string_view os,
                                                         std::string_view arch) {
    if (assets.empty()) return std::unexpected("no assets available");

    const auto os_aliases = OsAliases(os);
    const auto arch_aliases = ArchAliases(arch);

    for (const auto& a : assets) {
        const std::string name = ToLower(a.name);
        if (ContainsAny(name, os_aliases) && ContainsAny(name, arch_aliases)) return a;
    }
    for (const auto& a : assets) {
        if (ContainsAny(ToLower(a.name), os_aliases)) return a;
    }
    return assets.front();
}

} // namespace selfupdate
