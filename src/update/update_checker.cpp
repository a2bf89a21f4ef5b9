#include "selfupdate/update/update_checker.hpp"

#include "selfupdate/update/version.hpp"
#include "selfupdate/util/logger.hpp"

namespace selfupdate {

namespace {

// Clears the in-progress flag on every exit path.
class CheckGuard {
  public:
    CheckGuard(std::mutex& mu, bool& flag) : mu_(mu), flag_(flag) {}
    ~CheckGuard() {
        std::lock_guard<std::mutex> lk(mu_);
        flag_ = false;
    }
    CheckGuard(const CheckGuard&) = delete;
    CheckGuard& operator=(const CheckGuard&) = delete;

  private:
    std::mutex& mu_;
    bool& flag_;
};

} // namespace

std::chrono::hours CheckIntervalDuration(std::string_view interval) {
    using std::chrono::hours;
    if (interval == "weekly") return hours(24 * 7);
    if (interval == "monthly") return hours(24 * 30);
    return hours(24);
}

UpdateChecker::UpdateChecker(IReleaseProvider& provider,
                             ConfigStore& config,
                             BuildInfo build,
                             IUpdateMetrics* metrics)
    : provider_(provider),
      config_(config),
      build_(std::move(build)),
      metrics_(metrics),
      clock_([] { return std::chrono::system_clock::now(); }) {}

void UpdateChecker::SetClock(Clock clock) {
    clock_ = clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); });
}

std::expected<UpdateInfo, std::string> UpdateChecker::CheckForUpdates() {
    {
        std::lock_guard<std::mutex> lk(check_mu_);
        if (checking_) return std::unexpected("update check already in progress");
        checking_ = true;
    }
    CheckGuard guard(check_mu_, checking_);

    const auto started = std::chrono::steady_clock::now();
    auto result = RunCheck();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (!result) {
        LogWarn("Update check failed: %s", result.error().c_str());
        if (metrics_) metrics_->RecordUpdateCheck(build_.version, false, false, elapsed);
        return result;
    }

    const TimePoint now = clock_();
    {
        std::lock_guard<std::mutex> lk(cache_mu_);
        cached_ = *result;
        cached_at_ = now;
    }

    auto saved = config_.Modify([&](UpdateConfig& cfg) { cfg.last_check = now; });
    if (!saved.is_ok()) {
        LogWarn("Could not record last check time: %s", saved.msg.c_str());
    }

    if (metrics_) metrics_->RecordUpdateCheck(build_.version, true, result->has_update, elapsed);

    LogInfo("Update check: current=%s latest=%s has_update=%d",
            result->current_version.c_str(), result->latest_version.c_str(), result->has_update);
    return result;
}

std::expected<UpdateInfo, std::string> UpdateChecker::RunCheck() {
    const UpdateConfig cfg = config_.Get();

    auto release = provider_.GetLatestRelease(cfg.channel);
    if (!release) return std::unexpected("failed to get latest release: " + release.error());

    const std::string latest = GetVersionFromTag(release->tag_name);
    if (!IsValidVersion(latest)) {
        return std::unexpected("invalid version in release tag: " + release->tag_name);
    }

    UpdateInfo info;
    info.current_version = build_.version;
    info.latest_version = latest;
    info.release_notes = release->body;
    info.is_prerelease = release->prerelease;
    info.published_at = release->published_at;
    info.has_update = IsNewerVersion(build_.version, latest);

    ApplyFilters(cfg, *release, info);

    if (info.has_update && !release->assets.empty()) {
        auto asset = provider_.SelectAssetForPlatform(release->assets);
        if (asset) {
            info.download_url = asset->browser_download_url;
            info.asset_name = asset->name;
            info.asset_size = asset->size;
        } else {
            LogWarn("No suitable asset in release %s: %s",
                    release->tag_name.c_str(), asset.error().c_str());
        }
    }
    return info;
}

void UpdateChecker::ApplyFilters(const UpdateConfig& cfg, const Release& release, UpdateInfo& info) const {
    if (!info.has_update) return;

    if (!cfg.skip_version.empty() && GetVersionFromTag(cfg.skip_version) == info.latest_version) {
        LogInfo("Version %s is marked as skipped", info.latest_version.c_str());
        info.has_update = false;
        return;
    }

    if (!MatchesChannel(info.latest_version, cfg.channel)) {
        LogDebug("Version %s does not match channel %s", info.latest_version.c_str(), cfg.channel.c_str());
        info.has_update = false;
        return;
    }

    auto latest = Version::Parse(info.latest_version);
    const bool prerelease = release.prerelease || (latest && latest->IsPrerelease());
    if (prerelease && !cfg.allow_prerelease) {
        LogDebug("Ignoring prerelease %s", info.latest_version.c_str());
        info.has_update = false;
        return;
    }

    if (build_.IsDevelopmentBuild()) {
        auto current = Version::Parse(build_.version);
        if (current && latest && current->major == latest->major && current->minor == latest->minor) {
            LogDebug("Development build %s: ignoring same-series release %s",
                     build_.version.c_str(), info.latest_version.c_str());
            info.has_update = false;
        }
    }
}

bool UpdateChecker::ShouldCheck() const {
    const UpdateConfig cfg = config_.Get();
    if (!cfg.enabled) return false;
    if (IsChecking()) return false;
    if (!cfg.last_check) return true;
    return clock_() - *cfg.last_check >= CheckIntervalDuration(cfg.check_interval);
}

std::expected<UpdateInfo, std::string> UpdateChecker::GetAvailableUpdate() {
    {
        std::lock_guard<std::mutex> lk(cache_mu_);
        if (cached_ && clock_() - cached_at_ < kCacheTtl) return *cached_;
    }
    return CheckForUpdates();
}

bool UpdateChecker::IsChecking() const {
    std::lock_guard<std::mutex> lk(check_mu_);
    return checking_;
}

std::optional<TimePoint> UpdateChecker::GetLastCheck() const {
    return config_.Get().last_check;
}

std::optional<UpdateInfo> UpdateChecker::GetCachedResult() const {
    std::lock_guard<std::mutex> lk(cache_mu_);
    return cached_;
}

void UpdateChecker::SetToken(const std::string& token) {
    provider_.SetToken(token);
}

nlohmann::json UpdateChecker::GetRateLimitStatus() const {
    return provider_.GetRateLimitStatus();
}

bool UpdateChecker::IsPostponementActive(const UpdateInfo& info, TimePoint now) const {
    const UpdateConfig cfg = config_.Get();
    if (cfg.postponed_version.empty() || !cfg.postponed_until) return false;
    if (GetVersionFromTag(cfg.postponed_version) != info.latest_version) return false;
    return now < *cfg.postponed_until;
}

bool UpdateChecker::PostponementExpired(TimePoint now) const {
    const UpdateConfig cfg = config_.Get();
    if (cfg.postponed_version.empty() || !cfg.postponed_until) return false;
    return now >= *cfg.postponed_until;
}

} // namespace selfupdate
