#pragma once

#include "selfupdate/util/result.hpp"

#include <cstddef>
#include <string>

namespace selfupdate {

// Owning wrapper around a POSIX file descriptor.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    int Release();
    void Close();

    // Loops over short writes and EINTR.
    Result WriteAll(const void* data, size_t len) const;

    // Opens `path`, creating it if needed, and blocks until an exclusive
    // flock(2) is held on it. The lock is released when `out` is closed.
    static Result LockExclusive(const std::string& path, Fd& out);

  private:
    int fd_{-1};
};

} // namespace selfupdate
