#include "selfupdate/io/reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace selfupdate {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);

    const int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Result::Fail(
            errno, "Failed to open " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) == 0 && S_ISREG(st.st_mode)) {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    } else {
        out.size_ = std::nullopt;
    }
    return Result::Ok();
}

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        const ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) return n;
        if (errno == EINTR) continue;
        return -1;
    }
}

GzipReader::GzipReader(std::unique_ptr<IReader> source)
    : source_(std::move(source)), in_buffer_(16384) {
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;
    strm_.avail_in = 0;
    strm_.next_in = Z_NULL;

    // 16 + MAX_WBITS: expect a gzip header rather than raw zlib.
    initialized_ = inflateInit2(&strm_, 16 + MAX_WBITS) == Z_OK;
}

GzipReader::~GzipReader() {
    if (initialized_) inflateEnd(&strm_);
}

ssize_t GzipReader::Read(std::span<std::uint8_t> out) {
    if (!initialized_ || !source_) return -1;
    if (stream_end_ || out.empty()) return 0;

    strm_.next_out = out.data();
    strm_.avail_out = static_cast<uInt>(out.size());

    while (strm_.avail_out > 0) {
        if (strm_.avail_in == 0) {
            const ssize_t n = source_->Read(in_buffer_);
            if (n < 0) return -1;
            if (n == 0) {
                // Source drained before Z_STREAM_END: truncated member.
                if (strm_.avail_out == out.size()) return -1;
                break;
            }
            strm_.avail_in = static_cast<uInt>(n);
            strm_.next_in = in_buffer_.data();
        }

        const int ret = inflate(&strm_, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            stream_end_ = true;
            break;
        }
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            return -1;
        }
    }

    return static_cast<ssize_t>(out.size() - strm_.avail_out);
}

Result CopyReaderToFile(IReader& reader, const std::string& dst_path, unsigned mode) {
    Fd out(::open(dst_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode));
    if (!out.Valid()) return Result::FromErrno("open " + dst_path);

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(buf);
        if (n == 0) break;
        if (n < 0) return Result::Fail(EIO, "read failed while writing " + dst_path);
        auto w = out.WriteAll(buf.data(), static_cast<size_t>(n));
        if (!w.is_ok()) return w;
    }

    if (::fchmod(out.Get(), static_cast<mode_t>(mode)) != 0) {
        return Result::FromErrno("chmod " + dst_path);
    }
    if (::fsync(out.Get()) != 0) {
        return Result::FromErrno("fsync " + dst_path);
    }
    return Result::Ok();
}

} // namespace selfupdate
