#pragma once

#include "selfupdate/util/result.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace selfupdate {

// Filesystem primitives used while swapping executables. Tests substitute
// implementations that fail at chosen points.
class IFileOps {
  public:
    virtual ~IFileOps() = default;

    // Copies contents and permission bits; `dst` is created or truncated.
    virtual Result CopyFile(const std::string& src, const std::string& dst) const = 0;
    virtual Result Rename(const std::string& from, const std::string& to) const = 0;
    // Removing a path that does not exist succeeds.
    virtual Result Remove(const std::string& path) const = 0;
    virtual Result SetMode(const std::string& path, mode_t mode) const = 0;
    // True when `path` is an executable image the kernel refuses to open for
    // writing (ETXTBSY), i.e. it must be renamed aside rather than replaced.
    virtual bool IsBusyExecutable(const std::string& path) const = 0;
};

std::shared_ptr<const IFileOps> DefaultFileOps();

// mkdtemp-backed directory removed recursively on destruction.
class ScopedDirectory {
  public:
    static Result Create(std::string_view parent, std::string_view prefix, ScopedDirectory& out);

    ScopedDirectory() = default;
    ScopedDirectory(const ScopedDirectory&) = delete;
    ScopedDirectory& operator=(const ScopedDirectory&) = delete;
    ScopedDirectory(ScopedDirectory&& other) noexcept;
    ScopedDirectory& operator=(ScopedDirectory&& other) noexcept;
    ~ScopedDirectory();

    const std::string& Path() const { return path_; }

    // Removes the directory now; the destructor then does nothing.
    Result Remove();

  private:
    std::string path_;
};

} // namespace selfupdate
