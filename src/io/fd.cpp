#include "selfupdate/io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace selfupdate {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Fd::~Fd() { Close(); }

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

void Fd::Reset(int fd) {
    Close();
    fd_ = fd;
}

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

void Fd::Close() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = -1;
}

Result Fd::WriteAll(const void* data, size_t len) const {
    const auto* p = static_cast<const unsigned char*>(data);
    size_t off = 0;
    while (off < len) {
        const ssize_t n = ::write(fd_, p + off, len - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result::FromErrno("write");
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

Result Fd::LockExclusive(const std::string& path, Fd& out) {
    Fd fd(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644));
    if (!fd.Valid()) {
        const int e = errno;
        return Result::Fail(e, "open " + path + ": " + std::strerror(e));
    }
    while (::flock(fd.Get(), LOCK_EX) != 0) {
        const int e = errno;
        if (e == EINTR) continue;
        return Result::Fail(e, "flock " + path + ": " + std::strerror(e));
    }
    out = std::move(fd);
    return Result::Ok();
}

} // namespace selfupdate
