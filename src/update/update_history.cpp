#include "selfupdate/update/update_history.hpp"

#include "selfupdate/util/json_utils.hpp"
#include "selfupdate/util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>

namespace selfupdate {

using namespace jsonutil;

namespace {

std::string CsvField(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

const char* Outcome(const UpdateRecord& r) {
    if (r.success) return "success";
    if (r.rollback_attempted) return r.rollback_succeeded ? "rolled_back" : "failed";
    return "failed";
}

} // namespace

const char* ToString(UpdateAction action) {
    return action == UpdateAction::kRollback ? "rollback" : "install";
}

bool ParseUpdateAction(std::string_view text, UpdateAction& out) {
    if (text == "install") {
        out = UpdateAction::kInstall;
        return true;
    }
    if (text == "rollback") {
        out = UpdateAction::kRollback;
        return true;
    }
    return false;
}

bool ParseAuditFormat(std::string_view text, AuditFormat& out) {
    if (text == "text") {
        out = AuditFormat::kText;
    } else if (text == "csv") {
        out = AuditFormat::kCsv;
    } else if (text == "json") {
        out = AuditFormat::kJson;
    } else {
        return false;
    }
    return true;
}

nlohmann::json UpdateRecordToJson(const UpdateRecord& record) {
    nlohmann::json j = {
        {"id", record.id},
        {"timestamp", FormatRfc3339(record.timestamp)},
        {"action", ToString(record.action)},
        {"from_version", record.from_version},
        {"to_version", record.to_version},
        {"success", record.success},
        {"rollback_attempted", record.rollback_attempted},
        {"rollback_succeeded", record.rollback_succeeded},
        {"duration_ms", static_cast<std::uint64_t>(record.duration.count())},
    };
    if (!record.error.empty()) j["error"] = record.error;
    if (!record.backup_path.empty()) j["backup_path"] = record.backup_path;
    return j;
}

Result ParseUpdateRecord(const nlohmann::json& j, UpdateRecord& out) {
    if (!j.is_object()) return Result::Fail(EINVAL, "record must be a JSON object");
    if (!GetStringIfPresent(j, "id", out.id) || out.id.empty()) return Result::Fail(EINVAL, "record is missing 'id'");

    std::string text;
    if (!GetStringIfPresent(j, "timestamp", text) || !ParseRfc3339(text, out.timestamp)) {
        return Result::Fail(EINVAL, "record " + out.id + " has invalid timestamp '" + text + "'");
    }
    text.clear();
    GetStringIfPresent(j, "action", text);
    if (!ParseUpdateAction(text, out.action)) {
        return Result::Fail(EINVAL, "record " + out.id + " has invalid action '" + text + "'");
    }

    GetStringIfPresent(j, "from_version", out.from_version);
    GetStringIfPresent(j, "to_version", out.to_version);
    GetBoolIfPresent(j, "success", out.success);
    GetStringIfPresent(j, "error", out.error);
    GetBoolIfPresent(j, "rollback_attempted", out.rollback_attempted);
    GetBoolIfPresent(j, "rollback_succeeded", out.rollback_succeeded);
    GetStringIfPresent(j, "backup_path", out.backup_path);

    std::uint64_t ms = 0;
    GetU64IfPresent(j, "duration_ms", ms);
    out.duration = std::chrono::milliseconds(ms);
    return Result::Ok();
}

UpdateHistory::UpdateHistory() : clock_([] { return std::chrono::system_clock::now(); }) {}

UpdateHistory::UpdateHistory(std::string path, Clock clock) : path_(std::move(path)), clock_(std::move(clock)) {
    if (!clock_) clock_ = [] { return std::chrono::system_clock::now(); };
}

Result UpdateHistory::Load() {
    if (path_.empty()) return Result::Ok();

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) return Result::Ok();

    nlohmann::json doc;
    auto r = LoadJsonObjectFromFile(path_, doc);
    if (!r.is_ok()) return r;

    std::vector<UpdateRecord> records;
    if (auto it = doc.find("records"); it != doc.end()) {
        if (!it->is_array()) return Result::Fail(EINVAL, path_ + ": 'records' must be an array");
        for (const auto& item : *it) {
            UpdateRecord record;
            r = ParseUpdateRecord(item, record);
            if (!r.is_ok()) return Result::Fail(r.err, path_ + ": " + r.msg);
            records.push_back(std::move(record));
        }
    }

    std::lock_guard<std::mutex> lk(mu_);
    records_ = std::move(records);
    LogDebug("Loaded %zu update records from %s", records_.size(), path_.c_str());
    return Result::Ok();
}

Result UpdateHistory::StoreLocked(const std::vector<UpdateRecord>& records) {
    if (!path_.empty()) {
        nlohmann::json items = nlohmann::json::array();
        for (const auto& record : records) items.push_back(UpdateRecordToJson(record));
        auto r = WriteJsonFileAtomic(path_, nlohmann::json{{"records", std::move(items)}});
        if (!r.is_ok()) return Result::Fail(r.err, "failed to save update history: " + r.msg);
    }
    records_ = records;
    return Result::Ok();
}

Result UpdateHistory::Record(UpdateRecord record) {
    std::lock_guard<std::mutex> lk(mu_);
    if (record.timestamp == TimePoint{}) record.timestamp = clock_();
    if (record.id.empty()) {
        const auto unix_seconds =
            std::chrono::duration_cast<std::chrono::seconds>(record.timestamp.time_since_epoch()).count();
        record.id = std::string(ToString(record.action)) + "_" + std::to_string(unix_seconds) + "_" +
                    std::to_string(records_.size() + 1);
    }

    std::vector<UpdateRecord> next = records_;
    next.push_back(std::move(record));
    return StoreLocked(next);
}

std::vector<UpdateRecord> UpdateHistory::GetRecords(const HistoryFilter& filter) const {
    std::vector<UpdateRecord> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
            if (filter.action && it->action != *filter.action) continue;
            if (filter.success && it->success != *filter.success) continue;
            if (filter.since && it->timestamp < *filter.since) continue;
            out.push_back(*it);
        }
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const UpdateRecord& a, const UpdateRecord& b) { return a.timestamp > b.timestamp; });
    if (filter.limit > 0 && out.size() > filter.limit) out.resize(filter.limit);
    return out;
}

nlohmann::json UpdateHistory::GetSummary() const {
    std::lock_guard<std::mutex> lk(mu_);
    size_t successful = 0;
    size_t rollbacks = 0;
    for (const auto& r : records_) {
        if (r.success) ++successful;
        if (r.action == UpdateAction::kRollback) ++rollbacks;
    }
    const size_t total = records_.size();
    return {
        {"total", total},
        {"successful", successful},
        {"failed", total - successful},
        {"rollbacks", rollbacks},
        {"success_rate", total == 0 ? 0.0 : 100.0 * static_cast<double>(successful) / static_cast<double>(total)},
    };
}

std::string UpdateHistory::GetAuditTrail(AuditFormat format) const {
    std::lock_guard<std::mutex> lk(mu_);

    if (format == AuditFormat::kJson) {
        nlohmann::json items = nlohmann::json::array();
        for (const auto& record : records_) items.push_back(UpdateRecordToJson(record));
        return items.dump(2) + "\n";
    }

    std::string out;
    if (format == AuditFormat::kCsv) {
        out = "id,timestamp,action,from_version,to_version,status,duration_ms,backup_path,error\n";
        for (const auto& r : records_) {
            out += CsvField(r.id) + "," + FormatRfc3339(r.timestamp) + "," + ToString(r.action) + "," +
                   CsvField(r.from_version) + "," + CsvField(r.to_version) + "," + Outcome(r) + "," +
                   std::to_string(r.duration.count()) + "," + CsvField(r.backup_path) + "," + CsvField(r.error) +
                   "\n";
        }
        return out;
    }

    for (const auto& r : records_) {
        out += FormatRfc3339(r.timestamp) + " " + ToString(r.action) + " " + r.from_version + " -> " +
               r.to_version + " " + Outcome(r) + " (" + std::to_string(r.duration.count()) + " ms)";
        if (!r.error.empty()) out += ": " + r.error;
        out += "\n";
    }
    return out;
}

Result UpdateHistory::CleanupOldRecords(std::chrono::seconds older_than, size_t* removed) {
    const TimePoint cutoff = clock_() - older_than;
    std::lock_guard<std::mutex> lk(mu_);

    std::vector<UpdateRecord> kept;
    for (const auto& r : records_) {
        if (r.timestamp >= cutoff) kept.push_back(r);
    }
    const size_t dropped = records_.size() - kept.size();
    if (removed) *removed = 0;
    if (dropped == 0) return Result::Ok();

    auto r = StoreLocked(kept);
    if (!r.is_ok()) return r;
    if (removed) *removed = dropped;
    LogInfo("Removed %zu update records older than %s", dropped, FormatRfc3339(cutoff).c_str());
    return Result::Ok();
}

} // namespace selfupdate
