#include "selfupdate/update/artifact_extractor.hpp"

#include "selfupdate/io/file_ops.hpp"
#include "selfupdate/io/reader.hpp"
#include "selfupdate/update/archive_path_policy.hpp"
#include "selfupdate/util/logger.hpp"
#include "selfupdate/util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cerrno>
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

namespace selfupdate {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

std::string ArchiveErr(archive* a) {
    const char* s = archive_error_string(a);
    return s ? std::string(s) : std::string("unknown libarchive error");
}

// Picks the executable among several qualifying entries.
class BinaryChoice {
  public:
    explicit BinaryChoice(std::string product) : product_(ToLower(product)) {}

    void Offer(std::string_view base_name, const std::string& path) {
        const bool named = !product_.empty() && ToLower(base_name).find(product_) != std::string::npos;
        if (named) {
            named_ = path;
        } else {
            other_ = path;
        }
    }

    const std::string& Best() const { return named_.empty() ? other_ : named_; }

  private:
    std::string product_;
    std::string named_;
    std::string other_;
};

} // namespace

ArtifactKind DetectArtifactKind(std::string_view filename) {
    const std::string lower = ToLower(BaseName(filename));
    if (EndsWith(lower, ".tar.gz") || EndsWith(lower, ".tgz")) return ArtifactKind::kTarGz;
    if (EndsWith(lower, ".zip")) return ArtifactKind::kZip;
    if (EndsWith(lower, ".gz")) return ArtifactKind::kGzip;
    return ArtifactKind::kRaw;
}

bool IsExpectedArtifact(std::string_view name, std::string_view product, std::string_view os) {
    const std::string lower = ToLower(BaseName(name));
    if (lower.empty()) return false;
    if (!product.empty() && lower.find(ToLower(product)) != std::string::npos) return true;
    if (os == "windows") return EndsWith(lower, ".exe");
    return lower.find('.') == std::string::npos;
}

ArtifactPredicate MakeDefaultArtifactPredicate(std::string product) {
    return [product = std::move(product)](std::string_view name, std::string_view os) {
        return IsExpectedArtifact(name, product, os);
    };
}

std::string ExecutableFileName(std::string_view product, std::string_view os) {
    std::string name(product);
    if (os == "windows" && !EndsWith(ToLower(name), ".exe")) name += ".exe";
    return name;
}

ArtifactExtractor::ArtifactExtractor(Options opt) : opt_(std::move(opt)) {
    if (!opt_.is_binary) opt_.is_binary = MakeDefaultArtifactPredicate(opt_.product_name);
}

Result ArtifactExtractor::Extract(const std::string& artifact,
                                  const std::string& dst_dir,
                                  std::string& out_binary) const {
    std::error_code ec;
    if (!fs::is_regular_file(artifact, ec)) {
        return Result::Fail(ENOENT, "artifact not found: " + artifact);
    }
    if (!fs::is_directory(dst_dir, ec)) {
        return Result::Fail(ENOTDIR, "Destination path is not a directory: " + dst_dir);
    }

    out_binary.clear();
    const ArtifactKind kind = DetectArtifactKind(artifact);
    switch (kind) {
        case ArtifactKind::kTarGz:
        case ArtifactKind::kZip:
            return ExtractArchive(artifact, kind, dst_dir, out_binary);
        case ArtifactKind::kGzip:
            return ExtractGzip(artifact, dst_dir, out_binary);
        case ArtifactKind::kRaw:
            return CopyRaw(artifact, dst_dir, out_binary);
    }
    return Result::Fail(EINVAL, "unsupported artifact: " + artifact);
}

Result ArtifactExtractor::ExtractArchive(const std::string& artifact,
                                         ArtifactKind kind,
                                         const std::string& dst_dir,
                                         std::string& out_binary) const {
    const fs::path base_dir(dst_dir);

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(-1, "archive_read_new failed");

    if (kind == ArtifactKind::kZip) {
        archive_read_support_format_zip(ar.get());
    } else {
        archive_read_support_filter_gzip(ar.get());
        archive_read_support_format_tar(ar.get());
    }

    if (archive_read_open_filename(ar.get(), artifact.c_str(), 64 * 1024) != ARCHIVE_OK) {
        return Result::Fail(-1, "cannot open archive " + artifact + ": " + ArchiveErr(ar.get()));
    }

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Result::Fail(-1, "archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_PERM;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    ArchivePathPolicy path_policy;
    BinaryChoice choice(opt_.product_name);
    size_t files = 0;

    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return Result::Fail(-1, "corrupt archive " + artifact + ": " + ArchiveErr(ar.get()));
        }

        std::string rel;
        auto path_res = path_policy.NormalizeEntryPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;

        const auto type = archive_entry_filetype(entry);
        if (rel.empty() || (type != AE_IFREG && type != AE_IFDIR)) {
            if (!rel.empty()) LogWarn("Skipping non-regular archive entry %s", rel.c_str());
            if (archive_read_data_skip(ar.get()) != ARCHIVE_OK) {
                return Result::Fail(-1, "corrupt archive " + artifact + ": " + ArchiveErr(ar.get()));
            }
            continue;
        }

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());
        LogDebug("extract: %s", target_path.c_str());

        const int wh = archive_write_header(aw.get(), entry);
        if (wh != ARCHIVE_OK) return Result::Fail(-1, "archive_write_header: " + ArchiveErr(aw.get()));

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) {
                return Result::Fail(-1, "corrupt archive " + artifact + ": " + ArchiveErr(ar.get()));
            }
            if (archive_write_data_block(aw.get(), buff, size, offset) != ARCHIVE_OK) {
                return Result::Fail(-1, "archive_write_data_block: " + ArchiveErr(aw.get()));
            }
        }

        if (archive_write_finish_entry(aw.get()) != ARCHIVE_OK) {
            return Result::Fail(-1, "archive_write_finish_entry: " + ArchiveErr(aw.get()));
        }

        if (type == AE_IFREG) {
            ++files;
            const std::string_view base = BaseName(rel);
            if (opt_.is_binary(base, opt_.os)) choice.Offer(base, target_path);
        }
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return Result::Fail(-1, "archive_write_close: " + ArchiveErr(aw.get()));
    }

    if (choice.Best().empty()) {
        return Result::Fail(ENOENT, "binary not found in archive " + artifact + " (" +
                                        std::to_string(files) + " files)");
    }
    out_binary = choice.Best();
    return Result::Ok();
}

Result ArtifactExtractor::ExtractGzip(const std::string& artifact,
                                      const std::string& dst_dir,
                                      std::string& out_binary) const {
    auto file = std::make_unique<FileReader>();
    auto r = FileReader::Open(artifact, *file);
    if (!r.is_ok()) return r;

    GzipReader gz(std::move(file));
    if (!gz.Valid()) return Result::Fail(-1, "Failed to initialize zlib inflate");

    const std::string target = (fs::path(dst_dir) / ExecutableFileName(opt_.product_name, opt_.os)).string();
    r = CopyReaderToFile(gz, target, 0755);
    if (r.is_ok() && !gz.Finished()) r = Result::Fail(EIO, "truncated gzip stream");
    if (!r.is_ok()) return Result::Fail(r.err, "corrupt gzip artifact " + artifact + ": " + r.msg);

    out_binary = target;
    return Result::Ok();
}

Result ArtifactExtractor::CopyRaw(const std::string& artifact,
                                  const std::string& dst_dir,
                                  std::string& out_binary) const {
    const std::string target = (fs::path(dst_dir) / ExecutableFileName(opt_.product_name, opt_.os)).string();
    auto r = DefaultFileOps()->CopyFile(artifact, target);
    if (!r.is_ok()) return r;
    out_binary = target;
    return Result::Ok();
}

} // namespace selfupdate
