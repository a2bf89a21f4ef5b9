#include "selfupdate/update/downloader.hpp"

#include "selfupdate/crypto/sha256.hpp"
#include "selfupdate/io/reader.hpp"
#include "selfupdate/util/logger.hpp"
#include "selfupdate/util/path_utils.hpp"

#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace selfupdate {

namespace {

// Copies `src` to `dst` while hashing; `dst` is written via a ".part" sibling
// so an interrupted download never looks complete.
Result CopyAndHash(const std::string& src, const std::string& dst, std::uint64_t& size, std::string& hex) {
    FileReader reader;
    auto r = FileReader::Open(src, reader);
    if (!r.is_ok()) return r;

    const std::string part = dst + ".part";
    Fd out(::open(part.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!out.Valid()) return Result::FromErrno("open " + part);

    Sha256Hasher hasher;
    std::vector<std::uint8_t> buf(64 * 1024);
    size = 0;
    while (true) {
        const ssize_t n = reader.Read(buf);
        if (n == 0) break;
        if (n < 0) {
            ::unlink(part.c_str());
            return Result::FromErrno("read " + src);
        }
        const auto chunk = std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n));
        hasher.Update(chunk);
        auto w = out.WriteAll(chunk.data(), chunk.size());
        if (!w.is_ok()) {
            ::unlink(part.c_str());
            return w;
        }
        size += static_cast<std::uint64_t>(n);
    }
    if (::fsync(out.Get()) != 0) {
        auto e = Result::FromErrno("fsync " + part);
        ::unlink(part.c_str());
        return e;
    }
    out.Close();

    hex = hasher.FinalHex();
    if (hex.empty()) {
        ::unlink(part.c_str());
        return Result::Fail(-1, "sha256 failed for " + src);
    }
    if (::rename(part.c_str(), dst.c_str()) != 0) {
        auto e = Result::FromErrno("rename " + part);
        ::unlink(part.c_str());
        return e;
    }
    return Result::Ok();
}

} // namespace

MirrorDownloader::MirrorDownloader(Options opt) : opt_(std::move(opt)) {}

std::expected<std::string, std::string> MirrorDownloader::ResolveSource(const std::string& url) const {
    if (url.empty()) return std::unexpected("asset has no download URL");

    std::string path = url;
    if (StartsWith(url, "file://")) {
        path = url.substr(7);
    } else if (url.find("://") != std::string::npos) {
        return std::unexpected("unsupported download URL (mirror serves local files only): " + url);
    }

    fs::path p(path);
    if (p.is_relative() && !opt_.mirror_root.empty()) p = fs::path(opt_.mirror_root) / p;
    return p.lexically_normal().string();
}

std::expected<DownloadResult, std::string> MirrorDownloader::Download(const Release& release,
                                                                      const Asset& asset) {
    auto src = ResolveSource(asset.browser_download_url);
    if (!src) return std::unexpected(src.error());

    const std::string name(BaseName(asset.name));
    if (name.empty() || name == "." || name == "..") {
        return std::unexpected("invalid asset name: " + asset.name);
    }

    std::error_code ec;
    fs::create_directories(opt_.download_dir, ec);
    if (ec) {
        return std::unexpected("cannot create download directory " + opt_.download_dir + ": " + ec.message());
    }

    DownloadResult out;
    out.file_path = (fs::path(opt_.download_dir) / name).string();
    out.version = release.tag_name;

    const std::string expected_digest = asset.digest.empty() ? std::string() : NormalizeSha256(asset.digest);

    // A complete earlier download is reused.
    if (fs::is_regular_file(out.file_path, ec) && asset.size > 0 &&
        fs::file_size(out.file_path, ec) == asset.size && !ec) {
        std::string hex;
        auto h = Sha256HexFile(out.file_path, hex);
        if (h.is_ok() && (expected_digest.empty() || hex == expected_digest)) {
            LogInfo("Reusing downloaded %s", out.file_path.c_str());
            out.size = asset.size;
            out.checksum = hex;
            out.verified = !expected_digest.empty();
            return out;
        }
    }

    LogInfo("Downloading %s from %s", asset.name.c_str(), src->c_str());
    auto r = CopyAndHash(*src, out.file_path, out.size, out.checksum);
    if (!r.is_ok()) return std::unexpected("download failed: " + r.msg);

    if (asset.size > 0 && out.size != asset.size) {
        (void)fs::remove(out.file_path, ec);
        return std::unexpected("size mismatch for " + asset.name + ": expected " +
                               std::to_string(asset.size) + ", got " + std::to_string(out.size));
    }
    if (!expected_digest.empty()) {
        if (out.checksum != expected_digest) {
            (void)fs::remove(out.file_path, ec);
            return std::unexpected("checksum mismatch for " + asset.name + ": expected " +
                                   expected_digest + ", got " + out.checksum);
        }
        out.verified = true;
    }

    LogInfo("Downloaded %s (%llu bytes, sha256=%s)", out.file_path.c_str(),
            static_cast<unsigned long long>(out.size), out.checksum.c_str());
    return out;
}

} // namespace selfupdate
