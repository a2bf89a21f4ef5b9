#include "selfupdate/update/build_info.hpp"

#include <filesystem>

#ifndef SELFUPDATE_VERSION
#define SELFUPDATE_VERSION "v0.0.0-dev"
#endif
#ifndef SELFUPDATE_GIT_COMMIT
#define SELFUPDATE_GIT_COMMIT "unknown"
#endif
#ifndef SELFUPDATE_BUILD_DATE
#define SELFUPDATE_BUILD_DATE "unknown"
#endif
#ifndef SELFUPDATE_DIRTY
#define SELFUPDATE_DIRTY 1
#endif

namespace selfupdate {

BuildInfo BuildInfo::Current() {
    BuildInfo info;
    info.version = SELFUPDATE_VERSION;
    info.git_commit = SELFUPDATE_GIT_COMMIT;
    info.build_date = SELFUPDATE_BUILD_DATE;
    info.dirty = SELFUPDATE_DIRTY != 0;
    return info;
}

bool BuildInfo::IsDevelopmentBuild() const {
    return dirty || git_commit.empty() || git_commit == "unknown" || build_date.empty() ||
           build_date == "unknown";
}

std::string CurrentOs() {
#if defined(__linux__)
    return "linux";
#elif defined(__APPLE__)
    return "darwin";
#elif defined(_WIN32)
    return "windows";
#elif defined(__FreeBSD__)
    return "freebsd";
#else
    return "unknown";
#endif
}

std::string CurrentArch() {
#if defined(__x86_64__) || defined(_M_X64)
    return "amd64";
#elif defined(__aarch64__) || defined(_M_ARM64)
    return "arm64";
#elif defined(__i386__) || defined(_M_IX86)
    return "386";
#elif defined(__arm__)
    return "arm";
#elif defined(__riscv) && __riscv_xlen == 64
    return "riscv64";
#else
    return "unknown";
#endif
}

std::string CurrentPlatform() {
    return CurrentOs() + "-" + CurrentArch();
}

std::string CurrentExecutablePath() {
    std::error_code ec;
    const auto p = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) return {};
    return p.string();
}

} // namespace selfupdate
