#pragma once

#include "selfupdate/update/build_info.hpp"
#include "selfupdate/update/downloader.hpp"
#include "selfupdate/update/release_feed_provider.hpp"
#include "selfupdate/update/update_checker.hpp"
#include "selfupdate/update/update_config.hpp"
#include "selfupdate/update/update_history.hpp"
#include "selfupdate/update/update_installer.hpp"
#include "selfupdate/update/update_manager.hpp"
#include "selfupdate/update/update_metrics.hpp"
#include "selfupdate/update/update_scheduler.hpp"
#include "selfupdate/util/result.hpp"
#include "selfupdate/util/time_utils.hpp"

#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace selfupdate::cli {

struct GlobalOptions {
    std::string config_path;      // update.json
    std::string feed;             // overrides release_feed from the config
    std::string binary_path;      // live executable; defaults to /proc/self/exe
    std::string backup_dir;
    std::string work_dir;         // extraction and download scratch space
    std::string schedule_path;    // scheduler task table
    std::string history_path;     // install and rollback records
    std::string current_version;  // overrides the compiled-in version
    std::string log_file;
    std::string log_level;        // overrides the level implied by `verbose`
    bool verbose = false;
};

// Paths under $XDG_CONFIG_HOME/delta (or ~/.config/delta).
GlobalOptions DefaultGlobalOptions();

// Resolves the `when` argument of `schedule`:
//   +<duration>        relative to now ("+30m", "+1h30m")
//   YYYY-mm-dd HH:MM   local time
//   HH:MM              today, or tomorrow once that time has passed
//   @daily ...         next trigger of the cron period; `cron` receives it
bool ParseScheduleTime(std::string_view text, TimePoint now, TimePoint& out, std::string& cron);

// Owns one instance of every update component, wired from GlobalOptions.
class App {
  public:
    explicit App(GlobalOptions opt);

    // Loads the configuration and creates the working directories.
    Result Init();

    // Dispatches `args` (subcommand first). Returns the process exit code.
    int Run(const std::vector<std::string>& args);

    UpdateManager& Manager() { return *manager_; }
    UpdateScheduler& Scheduler() { return *scheduler_; }
    UpdateHistory& HistoryStore() { return *history_; }

  private:
    int Status();
    int Check();
    int Install(const std::vector<std::string>& args);
    int History(const std::vector<std::string>& args);
    int Rollback(const std::vector<std::string>& args);
    int Schedule(const std::vector<std::string>& args);
    int Cancel(const std::vector<std::string>& args);
    int Pending();
    int Cleanup(const std::vector<std::string>& args);
    int Skip(const std::vector<std::string>& args);
    int Postpone(const std::vector<std::string>& args);
    int Daemon();

    void PrintInstallFailure(const Result& r, const InstallResult& result) const;

    GlobalOptions opt_;
    BuildInfo build_;
    UpdateMetricsRecorder metrics_;
    std::unique_ptr<ConfigStore> config_;
    std::unique_ptr<UpdateHistory> history_;
    std::unique_ptr<ReleaseFeedProvider> provider_;
    std::unique_ptr<MirrorDownloader> downloader_;
    std::unique_ptr<UpdateInstaller> installer_;
    std::unique_ptr<UpdateManager> manager_;
    std::unique_ptr<UpdateChecker> checker_;
    std::unique_ptr<UpdateScheduler> scheduler_;
};

void PrintUsage(std::FILE* out, const char* argv0);

} // namespace selfupdate::cli
