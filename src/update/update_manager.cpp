#include "selfupdate/update/update_manager.hpp"

#include "selfupdate/util/logger.hpp"
#include "selfupdate/util/path_utils.hpp"

#include <cerrno>

namespace selfupdate {

namespace {

std::chrono::milliseconds Since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

UpdateManager::UpdateManager(ConfigStore& config,
                             IReleaseProvider& provider,
                             IDownloader& downloader,
                             UpdateInstaller& installer,
                             BuildInfo build,
                             IUpdateMetrics* metrics,
                             UpdateHistory* history)
    : config_(config),
      provider_(provider),
      downloader_(downloader),
      installer_(installer),
      build_(std::move(build)),
      metrics_(metrics),
      history_(history) {}

UpdateConfig UpdateManager::GetConfig() const {
    return config_.Get();
}

Result UpdateManager::SetConfig(const UpdateConfig& cfg) {
    if (!IsValidChannel(cfg.channel)) return Result::Fail(EINVAL, "invalid channel: " + cfg.channel);
    if (!IsValidNotificationLevel(cfg.notification_level)) {
        return Result::Fail(EINVAL, "invalid notification level: " + cfg.notification_level);
    }
    return config_.Set(cfg);
}

bool UpdateManager::IsEnabled() const {
    return config_.Get().enabled;
}

Result UpdateManager::RequireEnabled() const {
    if (!IsEnabled()) return Result::Fail(EPERM, "update system is disabled");
    return Result::Ok();
}

Result UpdateManager::SetEnabled(bool enabled) {
    return config_.Modify([&](UpdateConfig& cfg) { cfg.enabled = enabled; });
}

Result UpdateManager::SetChannel(const std::string& channel) {
    if (!IsValidChannel(channel)) return Result::Fail(EINVAL, "invalid channel: " + channel);
    return config_.Modify([&](UpdateConfig& cfg) { cfg.channel = channel; });
}

Result UpdateManager::SetNotificationLevel(const std::string& level) {
    if (!IsValidNotificationLevel(level)) {
        return Result::Fail(EINVAL, "invalid notification level: " + level +
                                        " (must be silent, notify, or prompt)");
    }
    return config_.Modify([&](UpdateConfig& cfg) { cfg.notification_level = level; });
}

std::expected<Release, std::string> UpdateManager::FindRelease(const std::string& version) {
    auto release = provider_.GetReleaseByTag(version);
    if (release || StartsWith(version, "v")) return release;

    auto prefixed = provider_.GetReleaseByTag("v" + version);
    if (prefixed) return prefixed;
    return std::unexpected(release.error());
}

void UpdateManager::RecordHistory(UpdateRecord record) {
    if (!history_) return;
    auto r = history_->Record(std::move(record));
    if (!r.is_ok()) LogWarn("Cannot record update history: %s", r.msg.c_str());
}

std::expected<DownloadResult, std::string> UpdateManager::DownloadUpdate(const std::string& version) {
    if (auto r = RequireEnabled(); !r.is_ok()) return std::unexpected(r.msg);

    auto release = FindRelease(version);
    if (!release) return std::unexpected("failed to get release " + version + ": " + release.error());

    auto asset = provider_.SelectAssetForPlatform(release->assets);
    if (!asset) return std::unexpected("release " + release->tag_name + ": " + asset.error());

    const auto started = std::chrono::steady_clock::now();
    auto result = downloader_.Download(*release, *asset);
    if (metrics_) {
        metrics_->RecordUpdateDownload(release->tag_name, result ? result->size : 0, Since(started),
                                       result.has_value());
    }
    return result;
}

Result UpdateManager::InstallUpdate(const DownloadResult& download, InstallResult& out) {
    if (auto r = RequireEnabled(); !r.is_ok()) return r;
    if (download.file_path.empty()) return Result::Fail(EINVAL, "download result has no file");

    const auto started = std::chrono::steady_clock::now();
    auto r = installer_.InstallUpdate(download, out);
    if (metrics_) {
        metrics_->RecordUpdateInstall(out.old_version, out.new_version, out.install_time, r.is_ok());
    }

    UpdateRecord record;
    record.action = UpdateAction::kInstall;
    record.from_version = out.old_version.empty() ? build_.version : out.old_version;
    record.to_version = out.new_version.empty() ? download.version : out.new_version;
    record.success = r.is_ok();
    record.error = r.is_ok() ? "" : r.msg;
    record.rollback_attempted = out.rollback_attempted;
    record.rollback_succeeded = out.rollback_succeeded;
    record.duration = Since(started);
    record.backup_path = out.backup_path;
    RecordHistory(std::move(record));
    if (!r.is_ok()) return r;

    auto pruned = installer_.CleanupOldBackups(UpdateInstaller::kDefaultKeepBackups);
    if (!pruned.is_ok()) LogWarn("Backup cleanup failed: %s", pruned.msg.c_str());
    return Result::Ok();
}

Result UpdateManager::DownloadAndInstallUpdate(const std::string& version, InstallResult& out) {
    if (auto r = RequireEnabled(); !r.is_ok()) return r;

    const auto started = std::chrono::steady_clock::now();
    auto download = DownloadUpdate(version);
    if (!download) {
        auto r = Result::Fail(-1, "download failed: " + download.error());
        UpdateRecord record;
        record.action = UpdateAction::kInstall;
        record.from_version = build_.version;
        record.to_version = version;
        record.error = r.msg;
        record.duration = Since(started);
        RecordHistory(std::move(record));
        return r;
    }
    return InstallUpdate(*download, out);
}

Result UpdateManager::RollbackToPreviousVersion(std::string* restored_from) {
    if (auto r = RequireEnabled(); !r.is_ok()) return r;

    auto backups = installer_.GetBackupInfo();
    if (!backups) return Result::Fail(-1, "failed to get backup info: " + backups.error());
    if (backups->empty()) return Result::Fail(ENOENT, "no backups available");

    // GetBackupInfo() lists newest first.
    const std::string newest = backups->front().backup_path;
    auto r = RollbackTo(newest);
    if (r.is_ok() && restored_from) *restored_from = newest;
    return r;
}

Result UpdateManager::RollbackTo(const std::string& backup_path) {
    if (auto r = RequireEnabled(); !r.is_ok()) return r;

    UpdateRecord record;
    record.action = UpdateAction::kRollback;
    record.from_version = build_.version;
    record.backup_path = backup_path;
    if (auto backups = installer_.GetBackupInfo()) {
        for (const auto& b : *backups) {
            if (b.backup_path == backup_path) record.to_version = b.version;
        }
    }

    const auto started = std::chrono::steady_clock::now();
    auto r = installer_.Rollback(backup_path);
    record.success = r.is_ok();
    record.error = r.is_ok() ? "" : r.msg;
    record.duration = Since(started);
    RecordHistory(std::move(record));
    return r;
}

std::expected<std::vector<BackupInfo>, std::string> UpdateManager::GetBackupInfo() const {
    return installer_.GetBackupInfo();
}

Result UpdateManager::CleanupOldBackups(size_t keep_count) {
    return installer_.CleanupOldBackups(keep_count);
}

Result UpdateManager::SkipVersion(const std::string& version) {
    if (version.empty()) return Result::Fail(EINVAL, "version is required");
    return config_.Modify([&](UpdateConfig& cfg) {
        cfg.skip_version = version;
        if (cfg.postponed_version == version) {
            cfg.postponed_version.clear();
            cfg.postponed_until.reset();
        }
    });
}

Result UpdateManager::Postpone(const std::string& version, TimePoint until) {
    if (version.empty()) return Result::Fail(EINVAL, "version is required");
    return config_.Modify([&](UpdateConfig& cfg) {
        cfg.postponed_version = version;
        cfg.postponed_until = until;
    });
}

Result UpdateManager::ClearPostponement() {
    return config_.Modify([](UpdateConfig& cfg) {
        cfg.postponed_version.clear();
        cfg.postponed_until.reset();
    });
}

} // namespace selfupdate
