#include "selfupdate/update/archive_path_policy.hpp"

#include "selfupdate/util/path_utils.hpp"

#include <cerrno>
#include <string_view>

namespace selfupdate {

bool ArchivePathPolicy::IsSafeRelativePath(const std::string& p) {
    if (p.empty()) return false;
    if (p.front() == '/') return false;
    if (p.find('\\') != std::string::npos) return false;
    // "C:foo" style drive prefixes from zip files made on Windows.
    if (p.size() >= 2 && p[1] == ':') return false;

    std::string_view sv(p);
    while (!sv.empty()) {
        const auto pos = sv.find('/');
        const auto seg = sv.substr(0, pos);
        if (seg == "..") return false;
        if (pos == std::string_view::npos) break;
        sv.remove_prefix(pos + 1);
    }
    return true;
}

Result ArchivePathPolicy::NormalizeEntryPath(const char* raw_path, std::string& out_relative) const {
    const std::string raw = raw_path ? std::string(raw_path) : std::string();
    if (!raw.empty() && raw.front() == '/') {
        return Result::Fail(EINVAL, "Absolute path in archive: " + raw);
    }

    out_relative = NormalizeArchivePath(raw);
    if (out_relative == ".") out_relative.clear();
    if (out_relative.empty()) return Result::Ok();

    if (!IsSafeRelativePath(out_relative)) {
        return Result::Fail(EINVAL, "Unsafe path in archive: " + out_relative);
    }
    return Result::Ok();
}

} // namespace selfupdate
