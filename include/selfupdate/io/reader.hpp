#pragma once

#include "selfupdate/io/fd.hpp"
#include "selfupdate/util/result.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <sys/types.h>
#include <vector>
#include <zlib.h>

namespace selfupdate {

class IReader {
public:
    virtual ~IReader() = default;
    // Returns bytes read, 0 at end of stream, -1 on error.
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }
};

class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader& out);

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return size_; }

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

// Inflates a single gzip member from `source`.
class GzipReader final : public IReader {
public:
    explicit GzipReader(std::unique_ptr<IReader> source);
    ~GzipReader() override;

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    ssize_t Read(std::span<std::uint8_t> out) override;

    // False when zlib could not be initialised; Read() then fails.
    bool Valid() const { return initialized_; }
    // True once the gzip trailer has been consumed.
    bool Finished() const { return stream_end_; }

private:
    std::unique_ptr<IReader> source_;
    z_stream strm_{};
    std::vector<std::uint8_t> in_buffer_;
    bool initialized_ = false;
    bool stream_end_ = false;
};

// Drains `reader` into a newly created file at `dst_path` with `mode`.
Result CopyReaderToFile(IReader& reader, const std::string& dst_path, unsigned mode);

} // namespace selfupdate
