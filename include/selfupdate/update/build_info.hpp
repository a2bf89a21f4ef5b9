#pragma once

#include <string>

namespace selfupdate {

// Identity of the running binary. Values come from SELFUPDATE_VERSION,
// SELFUPDATE_GIT_COMMIT, SELFUPDATE_BUILD_DATE and SELFUPDATE_DIRTY at
// compile time; tests construct their own.
struct BuildInfo {
    std::string version;     // "v1.2.3"
    std::string git_commit;
    std::string build_date;
    bool dirty = false;

    static BuildInfo Current();

    // Dirty tree or missing commit/date stamps.
    bool IsDevelopmentBuild() const;
};

// "linux", "darwin", "windows", ...
std::string CurrentOs();
// "amd64", "arm64", "386", "arm", ...
std::string CurrentArch();
// "<os>-<arch>"
std::string CurrentPlatform();

// Absolute path of the running executable, empty when it cannot be resolved.
std::string CurrentExecutablePath();

} // namespace selfupdate
