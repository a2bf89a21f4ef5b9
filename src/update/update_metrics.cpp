#include "selfupdate/update/update_metrics.hpp"

#include "selfupdate/util/logger.hpp"

namespace selfupdate {

void UpdateMetricsRecorder::RecordUpdateCheck(const std::string& current_version,
                                              bool success,
                                              bool has_update,
                                              std::chrono::milliseconds duration) {
    LogDebug("metrics: check version=%s success=%d has_update=%d duration_ms=%lld",
             current_version.c_str(), success, has_update, static_cast<long long>(duration.count()));
    std::lock_guard<std::mutex> lk(mu_);
    ++checks_.total;
    if (!success) ++checks_.failed;
    if (has_update) ++updates_found_;
    checks_.total_duration += duration;
}

void UpdateMetricsRecorder::RecordUpdateDownload(const std::string& version,
                                                 std::uint64_t size,
                                                 std::chrono::milliseconds duration,
                                                 bool success) {
    LogDebug("metrics: download version=%s size=%llu success=%d duration_ms=%lld",
             version.c_str(), static_cast<unsigned long long>(size), success,
             static_cast<long long>(duration.count()));
    std::lock_guard<std::mutex> lk(mu_);
    ++downloads_.total;
    if (!success) ++downloads_.failed;
    else bytes_downloaded_ += size;
    downloads_.total_duration += duration;
}

void UpdateMetricsRecorder::RecordUpdateInstall(const std::string& from_version,
                                                const std::string& to_version,
                                                std::chrono::milliseconds duration,
                                                bool success) {
    LogDebug("metrics: install %s -> %s success=%d duration_ms=%lld",
             from_version.c_str(), to_version.c_str(), success,
             static_cast<long long>(duration.count()));
    std::lock_guard<std::mutex> lk(mu_);
    ++installs_.total;
    if (!success) ++installs_.failed;
    installs_.total_duration += duration;
}

nlohmann::json UpdateMetricsRecorder::ToJson(const Counter& c) {
    const auto avg = c.total ? c.total_duration.count() / static_cast<long long>(c.total) : 0;
    return {{"total", c.total}, {"failed", c.failed}, {"avg_duration_ms", avg}};
}

nlohmann::json UpdateMetricsRecorder::Summary() const {
    std::lock_guard<std::mutex> lk(mu_);
    return {
        {"checks", ToJson(checks_)},
        {"downloads", ToJson(downloads_)},
        {"installs", ToJson(installs_)},
        {"updates_found", updates_found_},
        {"bytes_downloaded", bytes_downloaded_},
    };
}

} // namespace selfupdate
