#pragma once

#include "selfupdate/util/result.hpp"

#include <string>

namespace selfupdate {

// Maps raw archive entry names onto relative paths that stay inside the
// extraction directory.
class ArchivePathPolicy {
  public:
    // Empty `out_relative` means the entry names the archive root and should
    // be skipped.
    Result NormalizeEntryPath(const char* raw_path, std::string& out_relative) const;

    static bool IsSafeRelativePath(const std::string& p);
};

} // namespace selfupdate
