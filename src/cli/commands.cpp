#include "selfupdate/cli/commands.hpp"

#include "selfupdate/system/signals.hpp"
#include "selfupdate/update/cron_schedule.hpp"
#include "selfupdate/util/logger.hpp"
#include "selfupdate/util/path_utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <getopt.h>

namespace fs = std::filesystem;

namespace selfupdate::cli {

namespace {

constexpr std::chrono::milliseconds kDaemonPollInterval{5000};
constexpr std::chrono::hours kFinishedTaskRetention{24 * 7};
constexpr std::chrono::hours kHistoryRetention{24 * 90};
constexpr size_t kHistoryRows = 20;

std::string ConfigHome() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) return xdg;
    if (const char* home = std::getenv("HOME"); home && *home) return std::string(home) + "/.config";
    return ".config";
}

std::string ProductNameFor(const std::string& binary_path) {
    std::string name(BaseName(binary_path));
    if (EndsWith(ToLower(name), ".exe")) name.resize(name.size() - 4);
    return name.empty() ? std::string("delta") : name;
}

bool ParseCount(const std::string& text, long long& out) {
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0' || end == text.c_str() || v < 0) return false;
    out = v;
    return true;
}

bool ToLocalTime(const std::tm& in, TimePoint& out) {
    std::tm tm = in;
    tm.tm_isdst = -1;
    const std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) return false;
    out = std::chrono::system_clock::from_time_t(t);
    return true;
}

std::string Local(TimePoint tp) {
    return FormatLocalTime(tp, "%Y-%m-%d %H:%M:%S");
}

// getopt_long needs a mutable argv that starts with a program name.
class ArgvBuilder {
  public:
    ArgvBuilder(const char* name, const std::vector<std::string>& args) : storage_(args) {
        storage_.insert(storage_.begin(), name);
        for (auto& s : storage_) argv_.push_back(s.data());
        argv_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(argv_.size()) - 1; }
    char** argv() { return argv_.data(); }

  private:
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

} // namespace

GlobalOptions DefaultGlobalOptions() {
    const std::string base = ConfigHome() + "/delta";
    GlobalOptions opt;
    opt.config_path = base + "/update.json";
    opt.backup_dir = base + "/backups";
    opt.work_dir = base;
    opt.schedule_path = base + "/scheduled_updates.json";
    opt.history_path = base + "/update_history.json";
    return opt;
}

bool ParseScheduleTime(std::string_view text, TimePoint now, TimePoint& out, std::string& cron) {
    cron.clear();
    if (text.empty()) return false;

    if (text.front() == '+') {
        std::chrono::seconds d{};
        if (!ParseDuration(text.substr(1), d)) return false;
        out = now + d;
        return true;
    }

    if (auto period = ParseCronExpression(text)) {
        cron = std::string(text);
        out = NextCronTime(*period, now);
        return true;
    }

    const std::string s(text);
    std::tm tm{};
    const char* end = strptime(s.c_str(), "%Y-%m-%d %H:%M", &tm);
    if (end && *end == '\0') return ToLocalTime(tm, out);

    const std::time_t now_t = std::chrono::system_clock::to_time_t(now);
    std::tm today{};
    if (localtime_r(&now_t, &today) == nullptr) return false;
    tm = std::tm{};
    end = strptime(s.c_str(), "%H:%M", &tm);
    if (!end || *end != '\0') return false;

    today.tm_hour = tm.tm_hour;
    today.tm_min = tm.tm_min;
    today.tm_sec = 0;
    if (!ToLocalTime(today, out)) return false;
    if (out <= now) {
        ++today.tm_mday;
        return ToLocalTime(today, out);
    }
    return true;
}

void PrintUsage(std::FILE* out, const char* argv0) {
    std::fprintf(out,
        "Usage:\n"
        "   %s [options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  status                          Show build and update settings\n"
        "  check                           Check the release feed for a newer version\n"
        "  install [version]               Download and install a version (default: latest)\n"
        "  history [--audit text|csv|json] Show past installs and rollbacks, and backups\n"
        "  rollback [backup]               Restore a backup (default: newest)\n"
        "  schedule <version> <when>       Schedule an install; <when> is +30m, HH:MM,\n"
        "           [--cron EXPR]          'YYYY-mm-dd HH:MM' or @daily/@weekly/@monthly/@yearly\n"
        "           [--max-retries N] [--auto-confirm]\n"
        "  cancel <id>                     Cancel a pending scheduled install\n"
        "  pending                         List pending scheduled installs\n"
        "  cleanup [keep]                  Prune backups (default keep 5), finished tasks\n"
        "                                  and history older than 90 days\n"
        "  skip <version>                  Never offer this version again\n"
        "  postpone <version> <duration>   Hide this version for a while (e.g. 3d)\n"
        "  daemon                          Run scheduled installs until interrupted\n"
        "\n"
        "Options:\n"
        "  -c, --config <file>             Update configuration (default ~/.config/delta/update.json)\n"
        "  -f, --feed <path>               Release feed file or mirror directory\n"
        "  -b, --binary <path>             Executable to update (default: this program)\n"
        "      --backup-dir <dir>          Backup directory\n"
        "  -w, --work-dir <dir>            Download and extraction directory\n"
        "      --current-version <ver>     Version of the installed binary\n"
        "      --log-file <file>           Also append log lines to this file\n"
        "      --log-level <level>         debug, info, warn, error or none\n"
        "  -v, --verbose                   Debug logging\n"
        "  -h, --help                      Show this help\n",
        argv0);
}

App::App(GlobalOptions opt) : opt_(std::move(opt)), build_(BuildInfo::Current()) {
    if (!opt_.current_version.empty()) build_.version = opt_.current_version;
    if (opt_.binary_path.empty()) opt_.binary_path = CurrentExecutablePath();
}

Result App::Init() {
    LogLevel level = opt_.verbose ? LogLevel::Debug : LogLevel::Warn;
    if (!opt_.log_level.empty() && !ParseLogLevel(opt_.log_level, level)) {
        return Result::Fail(EINVAL, "invalid log level: " + opt_.log_level);
    }
    Logger::Instance().SetLevel(level);
    if (!opt_.log_file.empty()) {
        if (auto r = Logger::Instance().SetLogFile(opt_.log_file); !r.is_ok()) return r;
    }
    if (opt_.binary_path.empty()) {
        return Result::Fail(ENOENT, "cannot determine the executable path, use --binary");
    }

    config_ = std::make_unique<ConfigStore>(opt_.config_path);
    if (auto r = config_->Load(); !r.is_ok()) return r;
    const UpdateConfig cfg = config_->Get();

    ReleaseFeedProvider::Options feed;
    feed.feed = opt_.feed.empty() ? cfg.release_feed : opt_.feed;
    provider_ = std::make_unique<ReleaseFeedProvider>(std::move(feed));

    MirrorDownloader::Options dl;
    dl.mirror_root = provider_->BaseDirectory();
    dl.download_dir = cfg.download_directory.empty() ? opt_.work_dir + "/updates" : cfg.download_directory;
    downloader_ = std::make_unique<MirrorDownloader>(std::move(dl));

    UpdateInstaller::Options inst;
    inst.binary_path = opt_.binary_path;
    inst.backup_dir = opt_.backup_dir;
    inst.temp_dir = opt_.work_dir + "/temp";
    inst.product_name = ProductNameFor(opt_.binary_path);
    inst.current_version = build_.version;
    installer_ = std::make_unique<UpdateInstaller>(std::move(inst));
    if (auto r = installer_->Init(); !r.is_ok()) return r;

    history_ = std::make_unique<UpdateHistory>(opt_.history_path);
    if (auto r = history_->Load(); !r.is_ok()) return r;

    manager_ = std::make_unique<UpdateManager>(*config_, *provider_, *downloader_, *installer_, build_, &metrics_,
                                               history_.get());
    checker_ = std::make_unique<UpdateChecker>(*provider_, *config_, build_, &metrics_);

    UpdateScheduler::Options sched;
    sched.state_file = opt_.schedule_path;
    scheduler_ = std::make_unique<UpdateScheduler>(*manager_, std::move(sched));

    LogDebug("Config %s, binary %s, feed %s", opt_.config_path.c_str(), opt_.binary_path.c_str(),
             provider_->FeedFile().c_str());
    return Result::Ok();
}

int App::Run(const std::vector<std::string>& args) {
    if (args.empty()) {
        PrintUsage(stderr, "selfupdate");
        return 2;
    }
    const std::string& cmd = args.front();
    const std::vector<std::string> rest(args.begin() + 1, args.end());

    if (cmd == "status") return Status();
    if (cmd == "check") return Check();
    if (cmd == "install") return Install(rest);
    if (cmd == "history") return History(rest);
    if (cmd == "rollback") return Rollback(rest);
    if (cmd == "schedule") return Schedule(rest);
    if (cmd == "cancel") return Cancel(rest);
    if (cmd == "pending") return Pending();
    if (cmd == "cleanup") return Cleanup(rest);
    if (cmd == "skip") return Skip(rest);
    if (cmd == "postpone") return Postpone(rest);
    if (cmd == "daemon") return Daemon();

    std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
    PrintUsage(stderr, "selfupdate");
    return 2;
}

int App::Status() {
    const UpdateConfig cfg = config_->Get();

    std::printf("Version:        %s%s\n", build_.version.c_str(),
                build_.IsDevelopmentBuild() ? " (development build)" : "");
    std::printf("Commit:         %s\n", build_.git_commit.c_str());
    std::printf("Built:          %s\n", build_.build_date.c_str());
    std::printf("Platform:       %s\n", CurrentPlatform().c_str());
    std::printf("Binary:         %s\n", installer_->BinaryPath().c_str());
    std::printf("Updates:        %s\n", cfg.enabled ? "enabled" : "disabled");
    std::printf("Channel:        %s\n", cfg.channel.c_str());
    std::printf("Check interval: %s\n", cfg.check_interval.c_str());
    std::printf("Prereleases:    %s\n", cfg.allow_prerelease ? "allowed" : "ignored");
    std::printf("Auto install:   %s\n", cfg.auto_install ? "yes" : "no");
    std::printf("Notifications:  %s\n", cfg.notification_level.c_str());
    std::printf("Release feed:   %s\n", provider_->FeedFile().empty() ? "(none)" : provider_->FeedFile().c_str());
    std::printf("Last check:     %s\n", cfg.last_check ? Local(*cfg.last_check).c_str() : "never");
    if (!cfg.skip_version.empty()) std::printf("Skipped:        %s\n", cfg.skip_version.c_str());
    if (!cfg.postponed_version.empty() && cfg.postponed_until) {
        std::printf("Postponed:      %s until %s\n", cfg.postponed_version.c_str(),
                    Local(*cfg.postponed_until).c_str());
    }
    std::printf("Check due:      %s\n", checker_->ShouldCheck() ? "yes" : "no");
    return 0;
}

int App::Check() {
    if (!manager_->IsEnabled()) {
        std::fprintf(stderr, "ERROR: update system is disabled\n");
        return 1;
    }

    auto info = checker_->CheckForUpdates();
    if (!info) {
        std::fprintf(stderr, "ERROR: %s\n", info.error().c_str());
        return 1;
    }

    const auto now = std::chrono::system_clock::now();
    if (checker_->PostponementExpired(now)) {
        const UpdateConfig cfg = config_->Get();
        std::printf("Reminder: the postponement of %s has expired.\n", cfg.postponed_version.c_str());
        if (auto r = manager_->ClearPostponement(); !r.is_ok()) {
            LogWarn("Cannot clear postponement: %s", r.msg.c_str());
        }
    }

    if (!info->has_update) {
        std::printf("Up to date (%s, latest %s)\n", info->current_version.c_str(), info->latest_version.c_str());
        return 0;
    }
    if (checker_->IsPostponementActive(*info, now)) {
        const UpdateConfig cfg = config_->Get();
        std::printf("Update %s is postponed until %s\n", info->latest_version.c_str(),
                    Local(*cfg.postponed_until).c_str());
        return 0;
    }

    std::printf("Update available: %s -> %s%s\n", info->current_version.c_str(), info->latest_version.c_str(),
                info->is_prerelease ? " (prerelease)" : "");
    if (info->published_at != TimePoint{}) std::printf("Published: %s\n", Local(info->published_at).c_str());
    if (!info->asset_name.empty()) {
        std::printf("Asset: %s (%llu bytes)\n", info->asset_name.c_str(),
                    static_cast<unsigned long long>(info->asset_size));
    }
    if (!info->release_notes.empty()) std::printf("\n%s\n", info->release_notes.c_str());
    std::printf("\nRun 'install %s' to update.\n", info->latest_version.c_str());
    return 0;
}

void App::PrintInstallFailure(const Result& r, const InstallResult& result) const {
    std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
    if (result.rollback_attempted) {
        std::fprintf(stderr, "Rollback %s%s%s\n", result.rollback_succeeded ? "succeeded" : "failed",
                     result.rollback_error.empty() ? "" : ": ", result.rollback_error.c_str());
    }
    if (!result.backup_path.empty()) {
        std::fprintf(stderr, "Backup of the previous binary: %s\n", result.backup_path.c_str());
        std::fprintf(stderr, "Restore it with: rollback %s\n", result.backup_path.c_str());
    }
}

int App::Install(const std::vector<std::string>& args) {
    if (args.size() > 1) {
        std::fprintf(stderr, "Usage: install [version]\n");
        return 2;
    }

    std::string version;
    if (!args.empty()) {
        version = args.front();
    } else {
        auto info = checker_->CheckForUpdates();
        if (!info) {
            std::fprintf(stderr, "ERROR: %s\n", info.error().c_str());
            return 1;
        }
        if (!info->has_update) {
            std::printf("Already up to date (%s)\n", info->current_version.c_str());
            return 0;
        }
        version = info->latest_version;
    }

    std::printf("Installing %s over %s\n", version.c_str(), installer_->BinaryPath().c_str());
    InstallResult result;
    auto r = manager_->DownloadAndInstallUpdate(version, result);
    if (!r.is_ok()) {
        PrintInstallFailure(r, result);
        return 1;
    }

    std::printf("Updated %s -> %s in %lld ms\n", result.old_version.c_str(), result.new_version.c_str(),
                static_cast<long long>(result.install_time.count()));
    if (!result.backup_path.empty()) std::printf("Backup: %s\n", result.backup_path.c_str());
    return 0;
}

int App::History(const std::vector<std::string>& args) {
    if (!args.empty()) {
        AuditFormat format = AuditFormat::kText;
        if (args.size() != 2 || args[0] != "--audit" || !ParseAuditFormat(args[1], format)) {
            std::fprintf(stderr, "Usage: history [--audit text|csv|json]\n");
            return 2;
        }
        std::fputs(history_->GetAuditTrail(format).c_str(), stdout);
        return 0;
    }

    HistoryFilter filter;
    filter.limit = kHistoryRows;
    const auto records = history_->GetRecords(filter);
    if (records.empty()) {
        std::printf("No recorded updates\n");
    } else {
        const auto summary = history_->GetSummary();
        std::printf("%zu updates recorded, %zu failed (%.0f%% success)\n", summary["total"].get<size_t>(),
                    summary["failed"].get<size_t>(), summary["success_rate"].get<double>());
        std::printf("%-20s %-9s %-12s %-12s %-8s %s\n", "WHEN", "ACTION", "FROM", "TO", "RESULT", "DETAILS");
        for (const auto& r : records) {
            std::string details = std::to_string(r.duration.count()) + " ms";
            if (!r.error.empty()) details += ", " + r.error;
            if (r.rollback_attempted) {
                details += r.rollback_succeeded ? ", previous binary restored" : ", restore failed";
            }
            std::printf("%-20s %-9s %-12s %-12s %-8s %s\n", Local(r.timestamp).c_str(), ToString(r.action),
                        r.from_version.c_str(), r.to_version.c_str(), r.success ? "ok" : "failed",
                        details.c_str());
        }
    }
    std::printf("\n");

    auto backups = manager_->GetBackupInfo();
    if (!backups) {
        std::fprintf(stderr, "ERROR: %s\n", backups.error().c_str());
        return 1;
    }
    if (backups->empty()) {
        std::printf("No backups in %s\n", installer_->BackupDir().c_str());
        return 0;
    }

    std::printf("%-20s %-12s %10s  %s\n", "BACKED UP", "VERSION", "SIZE", "PATH");
    for (const auto& b : *backups) {
        std::printf("%-20s %-12s %10llu  %s\n", Local(b.backup_time).c_str(), b.version.c_str(),
                    static_cast<unsigned long long>(b.size), b.backup_path.c_str());
        LogDebug("sha256 %s  %s", b.checksum.c_str(), b.backup_path.c_str());
    }
    return 0;
}

int App::Rollback(const std::vector<std::string>& args) {
    if (args.size() > 1) {
        std::fprintf(stderr, "Usage: rollback [backup]\n");
        return 2;
    }

    std::string restored;
    Result r;
    if (args.empty()) {
        r = manager_->RollbackToPreviousVersion(&restored);
    } else {
        restored = args.front();
        r = manager_->RollbackTo(restored);
    }

    if (!r.is_ok()) {
        std::fprintf(stderr, "ERROR: rollback failed: %s\n", r.msg.c_str());
        return 1;
    }
    std::printf("Restored %s from %s\n", installer_->BinaryPath().c_str(), restored.c_str());
    return 0;
}

int App::Schedule(const std::vector<std::string>& args) {
    ScheduleOptions options;
    ArgvBuilder av("schedule", args);

    static option long_opts[] = {
        {"cron", required_argument, nullptr, 'c'},
        {"max-retries", required_argument, nullptr, 'r'},
        {"auto-confirm", no_argument, nullptr, 'y'},
        {nullptr, 0, nullptr, 0},
    };

    optind = 0;
    int c;
    while ((c = getopt_long(av.argc(), av.argv(), "c:r:y", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'c':
                options.cron_expression = optarg;
                break;

            case 'r': {
                long long v = 0;
                if (!ParseCount(optarg, v)) {
                    std::fprintf(stderr, "Invalid --max-retries: %s\n", optarg);
                    return 2;
                }
                options.max_retries = static_cast<int>(v);
                break;
            }

            case 'y':
                options.auto_confirm = true;
                break;

            default:
                return 2;
        }
    }

    std::vector<std::string> positional(av.argv() + optind, av.argv() + av.argc());
    // Accept an unquoted "YYYY-mm-dd HH:MM".
    if (positional.size() == 3) {
        positional[1] += " " + positional[2];
        positional.pop_back();
    }
    if (positional.size() != 2) {
        std::fprintf(stderr, "Usage: schedule <version> <when> [--cron EXPR] [--max-retries N] [--auto-confirm]\n");
        return 2;
    }

    TimePoint when{};
    std::string cron;
    if (!ParseScheduleTime(positional[1], std::chrono::system_clock::now(), when, cron)) {
        std::fprintf(stderr, "Invalid time: %s\n", positional[1].c_str());
        return 2;
    }
    if (options.cron_expression.empty()) options.cron_expression = cron;

    ScheduledUpdate task;
    auto r = scheduler_->EditStateFile([&] { return scheduler_->ScheduleUpdate(positional[0], when, options, task); });
    if (!r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }

    std::printf("Scheduled %s: version %s at %s%s%s\n", task.id.c_str(), task.version.c_str(),
                Local(task.scheduled_time).c_str(), task.is_recurring ? ", repeating " : "",
                task.cron_expression.c_str());
    std::printf("Scheduled installs run while '%s daemon' is active.\n", "selfupdate");
    return 0;
}

int App::Cancel(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::fprintf(stderr, "Usage: cancel <id>\n");
        return 2;
    }

    // A daemon records dispatched tasks as running under the same lock, so a
    // task it has started is reported busy here.
    auto r = scheduler_->EditStateFile([&] { return scheduler_->CancelScheduledUpdate(args.front()); });
    if (!r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }
    std::printf("Cancelled %s\n", args.front().c_str());
    return 0;
}

int App::Pending() {
    if (auto r = scheduler_->LoadFromFile(opt_.schedule_path); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }

    const auto pending = scheduler_->GetPendingUpdates();
    if (pending.empty()) {
        std::printf("No pending scheduled updates\n");
        return 0;
    }

    std::printf("%-40s %-12s %-20s %-8s %s\n", "ID", "VERSION", "WHEN", "RETRIES", "REPEAT");
    for (const auto& t : pending) {
        std::printf("%-40s %-12s %-20s %d/%-6d %s\n", t.id.c_str(), t.version.c_str(),
                    Local(t.scheduled_time).c_str(), t.retry_count, t.max_retries,
                    t.is_recurring ? t.cron_expression.c_str() : "-");
        if (!t.last_error.empty()) std::printf("    last error: %s\n", t.last_error.c_str());
    }
    return 0;
}

int App::Cleanup(const std::vector<std::string>& args) {
    long long keep = static_cast<long long>(UpdateInstaller::kDefaultKeepBackups);
    if (args.size() > 1 || (args.size() == 1 && (!ParseCount(args.front(), keep) || keep == 0))) {
        std::fprintf(stderr, "Usage: cleanup [keep]   (keep >= 1)\n");
        return 2;
    }

    if (auto r = manager_->CleanupOldBackups(static_cast<size_t>(keep)); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }

    size_t removed = 0;
    auto r = scheduler_->EditStateFile([&] {
        removed = scheduler_->CleanupCompletedTasks(kFinishedTaskRetention);
        return Result::Ok();
    });
    size_t records = 0;
    if (r.is_ok()) r = history_->CleanupOldRecords(kHistoryRetention, &records);
    if (!r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }
    std::printf("Kept the %lld newest backups, removed %zu finished scheduled updates and %zu history records\n",
                keep, removed, records);
    return 0;
}

int App::Skip(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::fprintf(stderr, "Usage: skip <version>\n");
        return 2;
    }
    if (auto r = manager_->SkipVersion(args.front()); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }
    std::printf("Version %s will be skipped\n", args.front().c_str());
    return 0;
}

int App::Postpone(const std::vector<std::string>& args) {
    std::chrono::seconds d{};
    if (args.size() != 2 || !ParseDuration(args[1], d) || d.count() == 0) {
        std::fprintf(stderr, "Usage: postpone <version> <duration>   (e.g. 12h, 3d)\n");
        return 2;
    }

    const TimePoint until = std::chrono::system_clock::now() + d;
    if (auto r = manager_->Postpone(args[0], until); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }
    std::printf("Version %s postponed for %s (until %s)\n", args[0].c_str(), FormatDuration(d).c_str(),
                Local(until).c_str());
    return 0;
}

int App::Daemon() {
    std::string startup_version;
    const UpdateConfig cfg = config_->Get();
    if (cfg.enabled && cfg.auto_install && cfg.check_on_startup && checker_->ShouldCheck()) {
        auto info = checker_->CheckForUpdates();
        if (!info) {
            LogWarn("Startup update check failed: %s", info.error().c_str());
        } else if (info->has_update && !checker_->IsPostponementActive(*info, std::chrono::system_clock::now())) {
            startup_version = info->latest_version;
        }
    }

    auto loaded = scheduler_->EditStateFile([&] {
        scheduler_->RequeueInterruptedTasks();
        if (startup_version.empty()) return Result::Ok();
        ScheduledUpdate task;
        auto r = scheduler_->ScheduleUpdate(startup_version, std::chrono::system_clock::now(),
                                            ScheduleOptions{.auto_confirm = true}, task);
        if (!r.is_ok()) LogWarn("Cannot schedule automatic update: %s", r.msg.c_str());
        return Result::Ok();
    });
    if (!loaded.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", loaded.msg.c_str());
        return 1;
    }

    if (auto r = scheduler_->Start(); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }
    // Tasks due at startup run immediately instead of after the first interval.
    scheduler_->SweepOnce();
    LogInfo("Daemon running with %zu pending scheduled updates", scheduler_->GetPendingUpdates().size());

    int rc = 0;
    while (!WaitForCancel(kDaemonPollInterval)) {
        if (auto r = scheduler_->SyncStateFile(); !r.is_ok()) LogError("Scheduler state: %s", r.msg.c_str());
    }

    LogInfo("Shutting down, waiting for running updates");
    if (auto r = scheduler_->Stop(); !r.is_ok()) LogWarn("%s", r.msg.c_str());
    scheduler_->WaitForIdle();
    if (auto r = scheduler_->SyncStateFile(); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        rc = 1;
    }
    return rc;
}

} // namespace selfupdate::cli
