#pragma once

#include "selfupdate/update/build_info.hpp"
#include "selfupdate/update/release_provider.hpp"
#include "selfupdate/update/update_config.hpp"
#include "selfupdate/update/update_metrics.hpp"
#include "selfupdate/update/update_types.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace selfupdate {

class UpdateChecker {
  public:
    using Clock = std::function<TimePoint()>;

    static constexpr std::chrono::minutes kCacheTtl{30};

    UpdateChecker(IReleaseProvider& provider,
                  ConfigStore& config,
                  BuildInfo build,
                  IUpdateMetrics* metrics = nullptr);

    void SetClock(Clock clock);

    // Only one check runs at a time; a concurrent call fails immediately
    // instead of waiting.
    std::expected<UpdateInfo, std::string> CheckForUpdates();

    // Disabled updates or a running check: false. Otherwise whether the
    // configured interval has elapsed since the last check.
    bool ShouldCheck() const;

    // The cached result when younger than kCacheTtl, otherwise a fresh check.
    std::expected<UpdateInfo, std::string> GetAvailableUpdate();

    bool IsChecking() const;
    std::optional<TimePoint> GetLastCheck() const;
    std::optional<UpdateInfo> GetCachedResult() const;

    void SetToken(const std::string& token);
    nlohmann::json GetRateLimitStatus() const;

    // `info` names the postponed version and the postponement still runs.
    bool IsPostponementActive(const UpdateInfo& info, TimePoint now) const;
    // A postponement is recorded and its deadline has passed.
    bool PostponementExpired(TimePoint now) const;

  private:
    std::expected<UpdateInfo, std::string> RunCheck();
    void ApplyFilters(const UpdateConfig& cfg, const Release& release, UpdateInfo& info) const;

    IReleaseProvider& provider_;
    ConfigStore& config_;
    BuildInfo build_;
    IUpdateMetrics* metrics_ = nullptr;
    Clock clock_;

    mutable std::mutex check_mu_;
    bool checking_ = false;

    mutable std::mutex cache_mu_;
    std::optional<UpdateInfo> cached_;
    TimePoint cached_at_{};
};

// Interval names understood by ShouldCheck(); anything else means daily.
std::chrono::hours CheckIntervalDuration(std::string_view interval);

} // namespace selfupdate
