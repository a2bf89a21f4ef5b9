#pragma once

#include "selfupdate/io/reader.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <zlib.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/selfupdate_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }
    std::string Sub(const std::string& name) const { return path_ + "/" + name; }

  private:
    std::string path_;
};

class MemoryReader final : public selfupdate::IReader {
  public:
    explicit MemoryReader(std::string data) : data_(data.begin(), data.end()) {}

    explicit MemoryReader(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size())
            return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
};

inline void WriteFile(const std::string& path, const std::string& contents, mode_t mode = 0644) {
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("cannot write " + path);
        out << contents;
    }
    if (::chmod(path.c_str(), mode) != 0) throw std::runtime_error("chmod failed: " + path);
}

inline void WriteFile(const std::string& path, const std::vector<std::uint8_t>& contents) {
    WriteFile(path, std::string(contents.begin(), contents.end()));
}

inline std::string ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return {};
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// A stand-in for the product: answers `--version` with `version` and exits 0.
inline std::string FakeBinary(const std::string& version) {
    return "#!/bin/sh\n"
           "if [ \"$1\" = \"--version\" ] || [ \"$1\" = \"version\" ]; then\n"
           "  echo \"delta " + version + "\"\n"
           "  exit 0\n"
           "fi\n"
           "exit 0\n";
}

inline void WriteScript(const std::string& path, const std::string& body) {
    WriteFile(path, body, 0755);
}

struct ArchiveEntry {
    std::string path;
    std::string contents;
    mode_t file_type = AE_IFREG;
    mode_t perm = 0755;
};

enum class ArchiveFormat { kTarGz, kZip };

inline std::vector<std::uint8_t> BuildArchive(const std::vector<ArchiveEntry>& entries,
                                              ArchiveFormat format = ArchiveFormat::kTarGz) {
    std::vector<std::uint8_t> out(4 * 1024 * 1024);
    size_t used = 0;

    archive* a = archive_write_new();
    if (!a)
        throw std::runtime_error("archive_write_new failed");

    int rc = ARCHIVE_OK;
    if (format == ArchiveFormat::kTarGz) {
        rc = archive_write_add_filter_gzip(a);
        if (rc == ARCHIVE_OK) rc = archive_write_set_format_pax_restricted(a);
    } else {
        rc = archive_write_set_format_zip(a);
    }
    if (rc != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("cannot configure archive writer");
    }
    if (archive_write_open_memory(a, out.data(), out.size(), &used) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_open_memory failed");
    }

    for (const auto& entry : entries) {
        archive_entry* hdr = archive_entry_new();
        if (!hdr) {
            (void)archive_write_free(a);
            throw std::runtime_error("archive_entry_new failed");
        }
        archive_entry_set_pathname(hdr, entry.path.c_str());
        archive_entry_set_filetype(hdr, entry.file_type);
        archive_entry_set_perm(hdr, entry.perm);
        archive_entry_set_size(hdr, static_cast<la_int64_t>(entry.contents.size()));
        if (archive_write_header(a, hdr) != ARCHIVE_OK) {
            archive_entry_free(hdr);
            (void)archive_write_free(a);
            throw std::runtime_error("archive_write_header failed");
        }
        if (!entry.contents.empty()) {
            if (archive_write_data(a, entry.contents.data(), entry.contents.size()) < 0) {
                archive_entry_free(hdr);
                (void)archive_write_free(a);
                throw std::runtime_error("archive_write_data failed");
            }
        }
        archive_entry_free(hdr);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_close failed");
    }
    if (archive_write_free(a) != ARCHIVE_OK) {
        throw std::runtime_error("archive_write_free failed");
    }
    out.resize(used);
    return out;
}

inline std::vector<std::uint8_t> GzipCompress(const std::string& data) {
    z_stream strm{};
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    std::vector<std::uint8_t> out(deflateBound(&strm, static_cast<uLong>(data.size())) + 64);
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());
    const int rc = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);
    if (rc != Z_STREAM_END) throw std::runtime_error("deflate failed");
    out.resize(strm.total_out);
    return out;
}

inline std::string ReadAll(selfupdate::IReader& reader) {
    std::string out;
    std::array<std::uint8_t, 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0)
            return {};
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return out;
}

} // namespace testutil
