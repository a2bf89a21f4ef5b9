#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace selfupdate {

// Observer for update activity. Implementations must be thread-safe.
class IUpdateMetrics {
  public:
    virtual ~IUpdateMetrics() = default;

    virtual void RecordUpdateCheck(const std::string& current_version,
                                   bool success,
                                   bool has_update,
                                   std::chrono::milliseconds duration) = 0;
    virtual void RecordUpdateDownload(const std::string& version,
                                      std::uint64_t size,
                                      std::chrono::milliseconds duration,
                                      bool success) = 0;
    virtual void RecordUpdateInstall(const std::string& from_version,
                                     const std::string& to_version,
                                     std::chrono::milliseconds duration,
                                     bool success) = 0;
};

// Keeps counters for the lifetime of the process and logs each event at
// debug level.
class UpdateMetricsRecorder final : public IUpdateMetrics {
  public:
    void RecordUpdateCheck(const std::string& current_version,
                           bool success,
                           bool has_update,
                           std::chrono::milliseconds duration) override;
    void RecordUpdateDownload(const std::string& version,
                              std::uint64_t size,
                              std::chrono::milliseconds duration,
                              bool success) override;
    void RecordUpdateInstall(const std::string& from_version,
                             const std::string& to_version,
                             std::chrono::milliseconds duration,
                             bool success) override;

    nlohmann::json Summary() const;

  private:
    struct Counter {
        std::uint64_t total = 0;
        std::uint64_t failed = 0;
        std::chrono::milliseconds total_duration{0};
    };

    static nlohmann::json ToJson(const Counter& c);

    mutable std::mutex mu_;
    Counter checks_;
    Counter downloads_;
    Counter installs_;
    std::uint64_t updates_found_ = 0;
    std::uint64_t bytes_downloaded_ = 0;
};

} // namespace selfupdate
