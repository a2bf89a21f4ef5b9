#pragma once

#include "selfupdate/update/build_info.hpp"
#include "selfupdate/update/downloader.hpp"
#include "selfupdate/update/release_provider.hpp"
#include "selfupdate/update/update_config.hpp"
#include "selfupdate/update/update_history.hpp"
#include "selfupdate/update/update_installer.hpp"
#include "selfupdate/update/update_metrics.hpp"
#include "selfupdate/update/update_types.hpp"

#include <expected>
#include <string>
#include <vector>

namespace selfupdate {

// What the scheduler needs to run a due task.
class IUpdateExecutor {
  public:
    virtual ~IUpdateExecutor() = default;
    virtual Result DownloadAndInstallUpdate(const std::string& version, InstallResult& out) = 0;
};

class UpdateManager final : public IUpdateExecutor {
  public:
    UpdateManager(ConfigStore& config,
                  IReleaseProvider& provider,
                  IDownloader& downloader,
                  UpdateInstaller& installer,
                  BuildInfo build,
                  IUpdateMetrics* metrics = nullptr,
                  UpdateHistory* history = nullptr);

    UpdateConfig GetConfig() const;
    Result SetConfig(const UpdateConfig& cfg);

    const BuildInfo& GetBuildInfo() const { return build_; }
    std::string GetCurrentVersion() const { return build_.version; }

    bool IsEnabled() const;
    Result SetEnabled(bool enabled);
    // stable, beta, alpha, nightly or dev.
    Result SetChannel(const std::string& channel);
    // silent, notify or prompt.
    Result SetNotificationLevel(const std::string& level);

    // Looks the release up as `version`, then as "v" + `version`.
    std::expected<DownloadResult, std::string> DownloadUpdate(const std::string& version);
    Result InstallUpdate(const DownloadResult& download, InstallResult& out);
    Result DownloadAndInstallUpdate(const std::string& version, InstallResult& out) override;

    // Restores the newest backup. `restored_from` receives its path.
    // Installs and rollbacks are appended to the history when one is set,
    // whether they succeed or not.
    Result RollbackToPreviousVersion(std::string* restored_from = nullptr);
    Result RollbackTo(const std::string& backup_path);

    std::expected<std::vector<BackupInfo>, std::string> GetBackupInfo() const;
    Result CleanupOldBackups(size_t keep_count);

    Result SkipVersion(const std::string& version);
    Result Postpone(const std::string& version, TimePoint until);
    Result ClearPostponement();

  private:
    Result RequireEnabled() const;
    std::expected<Release, std::string> FindRelease(const std::string& version);
    void RecordHistory(UpdateRecord record);

    ConfigStore& config_;
    IReleaseProvider& provider_;
    IDownloader& downloader_;
    UpdateInstaller& installer_;
    BuildInfo build_;
    IUpdateMetrics* metrics_ = nullptr;
    UpdateHistory* history_ = nullptr;
};

} // namespace selfupdate
