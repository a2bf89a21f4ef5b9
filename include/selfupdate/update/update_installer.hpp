#pragma once

#include "selfupdate/io/file_ops.hpp"
#include "selfupdate/update/artifact_extractor.hpp"
#include "selfupdate/update/binary_validator.hpp"
#include "selfupdate/update/build_info.hpp"
#include "selfupdate/update/update_types.hpp"
#include "selfupdate/util/result.hpp"

#include <cstddef>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace selfupdate {

class InstallJournal;

// Replaces the live executable with the one carried by a downloaded artifact.
//
// Pipeline: extract into a private directory, validate the new binary, back
// up the live one, swap it in, validate the result. A failed swap or
// validation restores the backup. The extraction directory is removed on
// every path, and every step is recorded in InstallResult::log_entries.
class UpdateInstaller {
  public:
    struct Options {
        std::string binary_path;      // live executable
        std::string backup_dir;
        std::string temp_dir;         // parent of extraction directories
        std::string product_name = "delta";
        std::string current_version;  // recorded in backups and results
        std::string os = CurrentOs();
        ArtifactPredicate is_binary;  // defaults to IsExpectedArtifact()
    };

    static constexpr size_t kDefaultKeepBackups = 5;

    explicit UpdateInstaller(Options opt,
                             std::shared_ptr<const IFileOps> file_ops = nullptr,
                             BinaryValidator validator = BinaryValidator());

    // Creates the backup and temp directories.
    Result Init();

    // `out` is filled on success and on failure.
    Result InstallUpdate(const DownloadResult& download, InstallResult& out);

    // Copies the live binary into the backup directory and validates the copy.
    Result CreateBackup(std::string& out_path);

    // Validates `backup_path` and swaps it in as the live binary.
    Result Rollback(const std::string& backup_path);

    // Newest first.
    std::expected<std::vector<BackupInfo>, std::string> GetBackupInfo() const;

    // Keeps the `keep_count` most recent backups; 0 means the default.
    // Individual removal failures are logged and skipped.
    Result CleanupOldBackups(size_t keep_count = kDefaultKeepBackups);

    const std::string& BinaryPath() const { return opt_.binary_path; }
    const std::string& BackupDir() const { return opt_.backup_dir; }

  private:
    Result RunPipeline(const DownloadResult& download,
                       const std::string& work_dir,
                       InstallJournal& journal,
                       InstallResult& out);
    Result CreateBackupLocked(std::string& out_path);
    Result RestoreFromBackup(const std::string& backup_path, InstallJournal& journal);
    void RollbackAfterFailure(const std::string& backup_path, InstallJournal& journal, InstallResult& out);
    Result ReplaceBinary(const std::string& source, const char* aside_suffix);
    std::string BackupPrefix() const;

    Options opt_;
    std::shared_ptr<const IFileOps> file_ops_;
    BinaryValidator validator_;
    ArtifactExtractor extractor_;
    std::mutex mu_;
};

// Splits "<product>_<version>_<YYYYmmdd>_<HHMMSS>[.N][.exe]" into version and
// local timestamp. False when `file_name` does not follow that pattern.
bool ParseBackupFileName(std::string_view file_name,
                         std::string_view product,
                         std::string& version,
                         TimePoint& when);

} // namespace selfupdate
