#include "selfupdate/update/update_installer.hpp"

#include "selfupdate/crypto/sha256.hpp"
#include "selfupdate/update/version.hpp"
#include "selfupdate/util/logger.hpp"
#include "selfupdate/util/path_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <ctime>
#include <filesystem>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace selfupdate {

const char* ToString(InstallStepStatus status) {
    switch (status) {
        case InstallStepStatus::kProgress: return "progress";
        case InstallStepStatus::kSuccess:  return "success";
        case InstallStepStatus::kError:    return "error";
    }
    return "unknown";
}

// Append-only record of one install or rollback attempt. Every entry is
// mirrored to the log.
class InstallJournal {
  public:
    void Progress(const char* step, const std::string& message) {
        LogInfo("[%s] %s", step, message.c_str());
        Append(step, InstallStepStatus::kProgress, message, {});
    }

    void Success(const char* step, const std::string& message) {
        LogInfo("[%s] %s", step, message.c_str());
        Append(step, InstallStepStatus::kSuccess, message, {});
    }

    void Error(const char* step, const std::string& message, const std::string& error) {
        LogError("[%s] %s: %s", step, message.c_str(), error.c_str());
        Append(step, InstallStepStatus::kError, message, error);
    }

    std::vector<InstallLogEntry> Take() { return std::move(entries_); }

  private:
    void Append(const char* step, InstallStepStatus status, const std::string& message, const std::string& error) {
        InstallLogEntry e;
        e.timestamp = std::chrono::system_clock::now();
        e.step = step;
        e.status = status;
        e.message = message;
        e.error = error;
        entries_.push_back(std::move(e));
    }

    std::vector<InstallLogEntry> entries_;
};

namespace {

constexpr mode_t kExecutableMode = 0755;

std::string StripExe(std::string_view name) {
    if (EndsWith(ToLower(name), ".exe")) name.remove_suffix(4);
    return std::string(name);
}

} // namespace

bool ParseBackupFileName(std::string_view file_name,
                         std::string_view product,
                         std::string& version,
                         TimePoint& when) {
    std::string rest = StripExe(file_name);
    const std::string prefix = std::string(product) + "_";
    if (!StartsWith(rest, prefix)) return false;
    rest.erase(0, prefix.size());

    const auto time_sep = rest.rfind('_');
    if (time_sep == std::string::npos) return false;
    std::string clock_part = rest.substr(time_sep + 1);
    if (const auto dot = clock_part.find('.'); dot != std::string::npos) clock_part.resize(dot);

    const auto date_sep = rest.rfind('_', time_sep == 0 ? 0 : time_sep - 1);
    if (date_sep == std::string::npos || date_sep == 0 || date_sep >= time_sep) return false;
    const std::string date_part = rest.substr(date_sep + 1, time_sep - date_sep - 1);
    if (date_part.size() != 8 || clock_part.size() != 6) return false;

    const std::string stamp = date_part + "_" + clock_part;
    std::tm tm{};
    const char* end = ::strptime(stamp.c_str(), "%Y%m%d_%H%M%S", &tm);
    if (!end || *end != '\0') return false;
    tm.tm_isdst = -1;
    const std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) return false;

    version = rest.substr(0, date_sep);
    when = std::chrono::system_clock::from_time_t(t);
    return !version.empty();
}

UpdateInstaller::UpdateInstaller(Options opt,
                                 std::shared_ptr<const IFileOps> file_ops,
                                 BinaryValidator validator)
    : opt_(std::move(opt)),
      file_ops_(file_ops ? std::move(file_ops) : DefaultFileOps()),
      validator_(std::move(validator)),
      extractor_(ArtifactExtractor::Options{opt_.product_name, opt_.os, opt_.is_binary}) {}

Result UpdateInstaller::Init() {
    if (opt_.binary_path.empty()) return Result::Fail(EINVAL, "no binary path configured");
    for (const auto& dir : {opt_.backup_dir, opt_.temp_dir}) {
        if (dir.empty()) continue;
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) return Result::Fail(ec.value(), "cannot create " + dir + ": " + ec.message());
    }
    return Result::Ok();
}

std::string UpdateInstaller::BackupPrefix() const {
    return opt_.product_name + "_";
}

Result UpdateInstaller::InstallUpdate(const DownloadResult& download, InstallResult& out) {
    std::lock_guard<std::mutex> lk(mu_);

    const auto started = std::chrono::steady_clock::now();
    InstallJournal journal;
    out = InstallResult{};
    out.old_version = opt_.current_version;
    out.new_version = download.version;

    auto finish = [&](Result r) {
        out.success = r.is_ok();
        if (!r.is_ok()) out.error = r.msg;
        out.install_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        out.log_entries = journal.Take();
        return r;
    };

    journal.Progress("start", "Installing " + download.version + " from " + download.file_path);

    ScopedDirectory work;
    auto r = ScopedDirectory::Create(opt_.temp_dir, "extract_", work);
    if (!r.is_ok()) {
        journal.Error("extract", "Cannot create extraction directory", r.msg);
        return finish(Result::Fail(r.err, "failed to create extraction directory: " + r.msg));
    }

    r = RunPipeline(download, work.Path(), journal, out);

    const std::string work_path = work.Path();
    auto cleaned = work.Remove();
    if (cleaned.is_ok()) {
        journal.Success("cleanup", "Removed " + work_path);
    } else {
        journal.Error("cleanup", "Could not remove extraction directory", cleaned.msg);
    }

    if (r.is_ok()) {
        journal.Success("complete", "Installed " + download.version + " at " + opt_.binary_path);
    }
    return finish(r);
}

Result UpdateInstaller::RunPipeline(const DownloadResult& download,
                                    const std::string& work_dir,
                                    InstallJournal& journal,
                                    InstallResult& out) {
    journal.Progress("extract", "Extracting " + download.file_path);
    std::string binary;
    auto r = extractor_.Extract(download.file_path, work_dir, binary);
    if (!r.is_ok()) {
        journal.Error("extract", "Extraction failed", r.msg);
        return Result::Fail(r.err, "failed to extract update: " + r.msg);
    }
    journal.Success("extract", "Found binary " + binary);

    journal.Progress("validate", "Validating " + binary);
    r = validator_.Validate(binary);
    if (!r.is_ok()) {
        journal.Error("validate", "New binary rejected", r.msg);
        return Result::Fail(r.err, "new binary validation failed: " + r.msg);
    }
    journal.Success("validate", "New binary runs");

    journal.Progress("backup", "Backing up " + opt_.binary_path);
    std::string backup;
    r = CreateBackupLocked(backup);
    if (!r.is_ok()) {
        journal.Error("backup", "Backup failed", r.msg);
        return Result::Fail(r.err, "failed to create backup: " + r.msg);
    }
    out.backup_path = backup;
    journal.Success("backup", "Backup written to " + backup);

    journal.Progress("install", "Replacing " + opt_.binary_path);
    r = ReplaceBinary(binary, ".old");
    if (!r.is_ok()) {
        journal.Error("install", "Replacement failed", r.msg);
        RollbackAfterFailure(backup, journal, out);
        return Result::Fail(r.err, "failed to install new binary: " + r.msg);
    }
    out.new_binary_path = opt_.binary_path;
    journal.Success("install", "Replaced " + opt_.binary_path);

    journal.Progress("verify", "Verifying " + out.new_binary_path);
    r = validator_.Validate(out.new_binary_path);
    if (!r.is_ok()) {
        journal.Error("verify", "Installed binary rejected", r.msg);
        RollbackAfterFailure(backup, journal, out);
        return Result::Fail(r.err, "installation verification failed: " + r.msg);
    }
    journal.Success("verify", "Installed binary runs");
    return Result::Ok();
}

void UpdateInstaller::RollbackAfterFailure(const std::string& backup_path,
                                           InstallJournal& journal,
                                           InstallResult& out) {
    out.rollback_attempted = true;
    auto r = RestoreFromBackup(backup_path, journal);
    out.rollback_succeeded = r.is_ok();
    if (!r.is_ok()) out.rollback_error = r.msg;
}

Result UpdateInstaller::RestoreFromBackup(const std::string& backup_path, InstallJournal& journal) {
    journal.Progress("rollback", "Restoring " + opt_.binary_path + " from " + backup_path);

    auto r = validator_.Validate(backup_path);
    if (!r.is_ok()) {
        journal.Error("rollback", "Backup rejected", r.msg);
        return Result::Fail(r.err, "backup validation failed: " + r.msg);
    }

    r = ReplaceBinary(backup_path, ".rollback");
    if (!r.is_ok()) {
        journal.Error("rollback", "Restore failed", r.msg);
        return Result::Fail(r.err, "failed to restore backup: " + r.msg);
    }

    journal.Success("rollback", "Restored " + opt_.binary_path);
    return Result::Ok();
}

Result UpdateInstaller::ReplaceBinary(const std::string& source, const char* aside_suffix) {
    const std::string& live = opt_.binary_path;

    if (file_ops_->IsBusyExecutable(live)) {
        // The running image cannot be rewritten in place: move it aside,
        // write the new file under the live name, then drop the old one.
        const std::string aside = live + aside_suffix;
        auto r = file_ops_->Rename(live, aside);
        if (!r.is_ok()) return Result::Fail(r.err, "cannot move running binary aside: " + r.msg);

        r = file_ops_->CopyFile(source, live);
        if (r.is_ok()) r = file_ops_->SetMode(live, kExecutableMode);
        if (!r.is_ok()) {
            auto back = file_ops_->Rename(aside, live);
            if (!back.is_ok()) {
                LogError("Could not move %s back to %s: %s", aside.c_str(), live.c_str(), back.msg.c_str());
            }
            return r;
        }

        auto rm = file_ops_->Remove(aside);
        if (!rm.is_ok()) LogWarn("Leaving %s behind: %s", aside.c_str(), rm.msg.c_str());
        return Result::Ok();
    }

    const std::string staged = live + ".new";
    auto r = file_ops_->CopyFile(source, staged);
    if (r.is_ok()) r = file_ops_->SetMode(staged, kExecutableMode);
    if (r.is_ok()) r = file_ops_->Rename(staged, live);
    if (!r.is_ok()) {
        auto rm = file_ops_->Remove(staged);
        if (!rm.is_ok()) LogWarn("Leaving %s behind: %s", staged.c_str(), rm.msg.c_str());
        return r;
    }
    return Result::Ok();
}

Result UpdateInstaller::CreateBackup(std::string& out_path) {
    std::lock_guard<std::mutex> lk(mu_);
    return CreateBackupLocked(out_path);
}

Result UpdateInstaller::CreateBackupLocked(std::string& out_path) {
    struct stat st{};
    if (::stat(opt_.binary_path.c_str(), &st) != 0) {
        return Result::FromErrno("current binary not found: " + opt_.binary_path);
    }

    std::error_code ec;
    fs::create_directories(opt_.backup_dir, ec);
    if (ec) return Result::Fail(ec.value(), "cannot create backup directory: " + ec.message());

    std::string version = GetVersionFromTag(opt_.current_version);
    if (version.empty()) version = "unknown";
    const std::string stem = BackupPrefix() + version + "_" +
                             FormatLocalTime(std::chrono::system_clock::now(), "%Y%m%d_%H%M%S");
    const std::string suffix = opt_.os == "windows" ? ".exe" : "";

    fs::path path = fs::path(opt_.backup_dir) / (stem + suffix);
    for (int n = 1; fs::exists(path, ec); ++n) {
        path = fs::path(opt_.backup_dir) / (stem + "." + std::to_string(n) + suffix);
    }

    auto discard = [&] {
        auto rm = file_ops_->Remove(path.string());
        if (!rm.is_ok()) LogWarn("Leaving incomplete backup %s: %s", path.c_str(), rm.msg.c_str());
    };

    auto r = file_ops_->CopyFile(opt_.binary_path, path.string());
    if (!r.is_ok()) {
        discard();
        return r;
    }

    r = validator_.Validate(path.string());
    if (!r.is_ok()) {
        discard();
        return Result::Fail(r.err, "backup validation failed: " + r.msg);
    }

    out_path = path.string();
    return Result::Ok();
}

Result UpdateInstaller::Rollback(const std::string& backup_path) {
    std::lock_guard<std::mutex> lk(mu_);
    InstallJournal journal;
    return RestoreFromBackup(backup_path, journal);
}

std::expected<std::vector<BackupInfo>, std::string> UpdateInstaller::GetBackupInfo() const {
    std::vector<BackupInfo> out;

    std::error_code ec;
    if (!fs::exists(opt_.backup_dir, ec)) return out;

    fs::directory_iterator it(opt_.backup_dir, ec);
    if (ec) return std::unexpected("cannot read backup directory " + opt_.backup_dir + ": " + ec.message());

    const std::string prefix = BackupPrefix();
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        const std::string name = entry.path().filename().string();
        std::error_code type_ec;
        if (!StartsWith(name, prefix) || !entry.is_regular_file(type_ec)) continue;

        BackupInfo info;
        info.backup_path = entry.path().string();
        info.original_path = opt_.binary_path;

        struct stat st{};
        if (::stat(info.backup_path.c_str(), &st) != 0) continue;
        info.size = static_cast<std::uint64_t>(st.st_size);

        if (!ParseBackupFileName(name, opt_.product_name, info.version, info.backup_time)) {
            info.version = "unknown";
            info.backup_time = std::chrono::system_clock::from_time_t(st.st_mtime);
        }

        auto h = Sha256HexFile(info.backup_path, info.checksum);
        if (!h.is_ok()) LogWarn("Cannot checksum %s: %s", info.backup_path.c_str(), h.msg.c_str());

        out.push_back(std::move(info));
    }
    if (ec) return std::unexpected("cannot read backup directory " + opt_.backup_dir + ": " + ec.message());

    std::sort(out.begin(), out.end(), [](const BackupInfo& a, const BackupInfo& b) {
        if (a.backup_time != b.backup_time) return a.backup_time > b.backup_time;
        return a.backup_path > b.backup_path;
    });
    return out;
}

Result UpdateInstaller::CleanupOldBackups(size_t keep_count) {
    if (keep_count == 0) keep_count = kDefaultKeepBackups;

    auto backups = GetBackupInfo();
    if (!backups) return Result::Fail(-1, backups.error());
    if (backups->size() <= keep_count) return Result::Ok();

    size_t removed = 0;
    for (size_t i = keep_count; i < backups->size(); ++i) {
        const auto& path = (*backups)[i].backup_path;
        auto r = file_ops_->Remove(path);
        if (!r.is_ok()) {
            LogWarn("Failed to remove old backup %s: %s", path.c_str(), r.msg.c_str());
            continue;
        }
        ++removed;
    }
    LogInfo("Removed %zu old backups, kept %zu", removed, keep_count);
    return Result::Ok();
}

} // namespace selfupdate
