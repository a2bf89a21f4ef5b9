#include "selfupdate/update/version.hpp"

#include "selfupdate/util/path_utils.hpp"

#include <cctype>
#include <charconv>
#include <ranges>

namespace selfupdate {

namespace {

bool ParseNumber(std::string_view part, int& out) {
    if (part.empty()) return false;
    auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), out);
    return ec == std::errc() && ptr == part.data() + part.size();
}

bool IsIdentifierList(std::string_view s) {
    if (s.empty()) return false;
    for (auto&& rng : s | std::views::split('.')) {
        std::string_view ident(rng.begin(), rng.end());
        if (ident.empty()) return false;
        for (char c : ident) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') return false;
        }
    }
    return true;
}

std::string_view StripTagPrefix(std::string_view tag) {
    for (std::string_view prefix : {"version-", "release-"}) {
        if (StartsWith(tag, prefix)) {
            tag.remove_prefix(prefix.size());
            break;
        }
    }
    if (!tag.empty() && (tag.front() == 'v' || tag.front() == 'V')) tag.remove_prefix(1);
    return tag;
}

} // namespace

std::expected<Version, std::string> Version::Parse(std::string_view text) {
    const std::string_view original = text;
    text = StripTagPrefix(text);
    if (text.empty()) return std::unexpected("invalid semantic version: " + std::string(original));

    Version v;
    if (const auto plus = text.find('+'); plus != std::string_view::npos) {
        v.build = std::string(text.substr(plus + 1));
        text = text.substr(0, plus);
        if (!IsIdentifierList(v.build)) {
            return std::unexpected("invalid build metadata in '" + std::string(original) + "'");
        }
    }
    if (const auto dash = text.find('-'); dash != std::string_view::npos) {
        v.prerelease = std::string(text.substr(dash + 1));
        text = text.substr(0, dash);
        if (!IsIdentifierList(v.prerelease)) {
            return std::unexpected("invalid prerelease in '" + std::string(original) + "'");
        }
    }

    int* fields[] = {&v.major, &v.minor, &v.patch};
    size_t idx = 0;
    for (auto&& rng : text | std::views::split('.')) {
        if (idx >= 3) return std::unexpected("invalid semantic version: " + std::string(original));
        if (!ParseNumber(std::string_view(rng.begin(), rng.end()), *fields[idx])) {
            return std::unexpected("invalid semantic version: " + std::string(original));
        }
        ++idx;
    }
    if (idx != 3) return std::unexpected("invalid semantic version: " + std::string(original));
    return v;
}

std::string Version::Channel() const {
    if (prerelease.empty()) return "stable";
    const std::string lower = ToLower(prerelease);
    if (lower.find("alpha") != std::string::npos) return "alpha";
    if (lower.find("beta") != std::string::npos) return "beta";
    return "prerelease";
}

std::string Version::ToString() const {
    std::string out = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    if (!prerelease.empty()) out += "-" + prerelease;
    if (!build.empty()) out += "+" + build;
    return out;
}

std::weak_ordering Version::operator<=>(const Version& other) const {
    if (auto c = major <=> other.major; c != 0) return c;
    if (auto c = minor <=> other.minor; c != 0) return c;
    if (auto c = patch <=> other.patch; c != 0) return c;

    if (prerelease.empty() && other.prerelease.empty()) return std::weak_ordering::equivalent;
    if (prerelease.empty()) return std::weak_ordering::greater;
    if (other.prerelease.empty()) return std::weak_ordering::less;
    return prerelease.compare(other.prerelease) <=> 0;
}

int CompareVersions(std::string_view a, std::string_view b) {
    auto va = Version::Parse(a);
    auto vb = Version::Parse(b);
    if (!va || !vb) {
        const int c = a.compare(b);
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    const auto c = *va <=> *vb;
    if (c < 0) return -1;
    if (c > 0) return 1;
    return 0;
}

bool IsNewerVersion(std::string_view current, std::string_view candidate) {
    return CompareVersions(candidate, current) > 0;
}

bool IsValidVersion(std::string_view text) {
    return Version::Parse(text).has_value();
}

std::string GetVersionFromTag(std::string_view tag) {
    return std::string(StripTagPrefix(tag));
}

bool MatchesChannel(std::string_view version, std::string_view channel) {
    auto v = Version::Parse(version);
    if (!v) return false;

    const std::string lower = ToLower(v->prerelease);
    if (channel == "stable") return v->prerelease.empty();
    if (channel == "alpha") return lower.find("alpha") != std::string::npos;
    if (channel == "beta") return lower.find("beta") != std::string::npos;
    return true;
}

} // namespace selfupdate
