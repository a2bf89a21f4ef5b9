#pragma once

#include <compare>
#include <expected>
#include <string>
#include <string_view>

namespace selfupdate {

// MAJOR.MINOR.PATCH[-PRERELEASE][+BUILD]
struct Version {
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::string prerelease;
    std::string build;

    // Accepts an optional leading "v" and the "version-"/"release-" tag
    // prefixes.
    static std::expected<Version, std::string> Parse(std::string_view text);

    bool IsPrerelease() const { return !prerelease.empty(); }

    // "stable", "alpha", "beta" or "prerelease".
    std::string Channel() const;

    // Rendered without a leading "v".
    std::string ToString() const;

    // Build metadata does not take part in ordering: versions that differ
    // only in it are equivalent, and == tests that equivalence.
    std::weak_ordering operator<=>(const Version& other) const;
    bool operator==(const Version& other) const { return (*this <=> other) == 0; }
};

// -1/0/1. When either side does not parse, falls back to comparing the raw
// strings.
int CompareVersions(std::string_view a, std::string_view b);

bool IsNewerVersion(std::string_view current, std::string_view candidate);

bool IsValidVersion(std::string_view text);

// Strips the "v", "version-" or "release-" prefix of a release tag.
std::string GetVersionFromTag(std::string_view tag);

// stable: no prerelease; alpha/beta: prerelease contains that word; any other
// channel accepts everything. An unparsable version matches nothing.
bool MatchesChannel(std::string_view version, std::string_view channel);

} // namespace selfupdate
