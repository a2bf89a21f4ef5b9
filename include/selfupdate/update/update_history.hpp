#pragma once

#include "selfupdate/util/result.hpp"
#include "selfupdate/util/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace selfupdate {

enum class UpdateAction { kInstall, kRollback };

const char* ToString(UpdateAction action);
bool ParseUpdateAction(std::string_view text, UpdateAction& out);

struct UpdateRecord {
    std::string id;
    TimePoint timestamp{};
    UpdateAction action = UpdateAction::kInstall;
    std::string from_version;
    std::string to_version;
    bool success = false;
    std::string error;
    // Whether the previous binary was put back after a failed install.
    bool rollback_attempted = false;
    bool rollback_succeeded = false;
    std::chrono::milliseconds duration{0};
    std::string backup_path;
};

nlohmann::json UpdateRecordToJson(const UpdateRecord& record);
Result ParseUpdateRecord(const nlohmann::json& j, UpdateRecord& out);

struct HistoryFilter {
    std::optional<UpdateAction> action;
    std::optional<bool> success;
    std::optional<TimePoint> since;
    size_t limit = 0; // 0: no limit
};

enum class AuditFormat { kText, kCsv, kJson };

bool ParseAuditFormat(std::string_view text, AuditFormat& out);

// Persistent log of installs and rollbacks, stored as {"records": [...]}.
class UpdateHistory {
  public:
    using Clock = std::function<TimePoint()>;

    // In-memory only.
    UpdateHistory();
    explicit UpdateHistory(std::string path, Clock clock = {});

    // A missing file is an empty history.
    Result Load();

    // Fills in id and timestamp when unset. The record is only kept when
    // persisting succeeds.
    Result Record(UpdateRecord record);

    // Newest first.
    std::vector<UpdateRecord> GetRecords(const HistoryFilter& filter = {}) const;

    // Totals over all records: total, successful, failed, rollbacks and
    // success_rate (percent).
    nlohmann::json GetSummary() const;

    // Oldest first.
    std::string GetAuditTrail(AuditFormat format) const;

    // Drops records older than now - older_than.
    Result CleanupOldRecords(std::chrono::seconds older_than, size_t* removed = nullptr);

    const std::string& Path() const { return path_; }

  private:
    Result StoreLocked(const std::vector<UpdateRecord>& records);

    std::string path_;
    Clock clock_;
    mutable std::mutex mu_;
    std::vector<UpdateRecord> records_;
};

} // namespace selfupdate
