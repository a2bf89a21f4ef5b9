#include "selfupdate/io/file_ops.hpp"

#include "selfupdate/io/reader.hpp"
#include "selfupdate/util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace selfupdate {

namespace {

class PosixFileOps final : public IFileOps {
  public:
    Result CopyFile(const std::string& src, const std::string& dst) const override {
        struct stat st{};
        if (::stat(src.c_str(), &st) != 0) return Result::FromErrno("stat " + src);
        if (!S_ISREG(st.st_mode)) return Result::Fail(EINVAL, "not a regular file: " + src);

        FileReader reader;
        auto r = FileReader::Open(src, reader);
        if (!r.is_ok()) return r;
        return CopyReaderToFile(reader, dst, st.st_mode & 07777);
    }

    Result Rename(const std::string& from, const std::string& to) const override {
        if (::rename(from.c_str(), to.c_str()) != 0) {
            return Result::FromErrno("rename " + from + " -> " + to);
        }
        return Result::Ok();
    }

    Result Remove(const std::string& path) const override {
        if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
            return Result::FromErrno("remove " + path);
        }
        return Result::Ok();
    }

    Result SetMode(const std::string& path, mode_t mode) const override {
        if (::chmod(path.c_str(), mode) != 0) return Result::FromErrno("chmod " + path);
        return Result::Ok();
    }

    bool IsBusyExecutable(const std::string& path) const override {
        const int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
        if (fd >= 0) {
            ::close(fd);
            return false;
        }
        return errno == ETXTBSY;
    }
};

} // namespace

std::shared_ptr<const IFileOps> DefaultFileOps() {
    static const std::shared_ptr<const IFileOps> kDefault = std::make_shared<PosixFileOps>();
    return kDefault;
}

Result ScopedDirectory::Create(std::string_view parent, std::string_view prefix, ScopedDirectory& out) {
    const fs::path base = parent.empty() ? fs::temp_directory_path() : fs::path(parent);
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) return Result::Fail(ec.value(), "cannot create " + base.string() + ": " + ec.message());

    std::string tmpl = (base / (std::string(prefix) + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    char* created = ::mkdtemp(buf.data());
    if (!created) return Result::FromErrno("mkdtemp " + tmpl);

    if (auto r = out.Remove(); !r.is_ok()) LogWarn("%s", r.msg.c_str());
    out.path_ = created;
    return Result::Ok();
}

ScopedDirectory::ScopedDirectory(ScopedDirectory&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScopedDirectory& ScopedDirectory::operator=(ScopedDirectory&& other) noexcept {
    if (this != &other) {
        if (auto r = Remove(); !r.is_ok()) LogWarn("%s", r.msg.c_str());
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

ScopedDirectory::~ScopedDirectory() {
    auto r = Remove();
    if (!r.is_ok()) LogWarn("%s", r.msg.c_str());
}

Result ScopedDirectory::Remove() {
    if (path_.empty()) return Result::Ok();
    std::error_code ec;
    fs::remove_all(path_, ec);
    const std::string path = std::move(path_);
    path_.clear();
    if (ec) return Result::Fail(ec.value(), "cannot remove " + path + ": " + ec.message());
    return Result::Ok();
}

} // namespace selfupdate
