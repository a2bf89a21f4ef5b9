#pragma once

#include "selfupdate/util/time_utils.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace selfupdate {

// Outcome of one update check. Produced fresh per check and not modified
// afterwards.
struct UpdateInfo {
    bool has_update = false;
    std::string current_version;
    std::string latest_version;
    std::string download_url;
    std::string asset_name;
    std::uint64_t asset_size = 0;
    std::string release_notes;
    bool is_prerelease = false;
    TimePoint published_at{};
};

struct DownloadResult {
    std::string file_path;
    std::string version;
    std::uint64_t size = 0;
    std::string checksum;   // sha256 hex
    bool verified = false;  // matched a digest published with the asset
};

enum class InstallStepStatus { kProgress, kSuccess, kError };

const char* ToString(InstallStepStatus status);

struct InstallLogEntry {
    TimePoint timestamp{};
    std::string step;
    InstallStepStatus status = InstallStepStatus::kProgress;
    std::string message;
    std::string error;
};

struct InstallResult {
    bool success = false;
    std::string backup_path;
    std::string new_binary_path;
    std::string old_version;
    std::string new_version;
    std::chrono::milliseconds install_time{0};
    std::string error;

    bool rollback_attempted = false;
    bool rollback_succeeded = false;
    std::string rollback_error;

    std::vector<InstallLogEntry> log_entries;
};

struct BackupInfo {
    std::string backup_path;
    std::string original_path;
    std::string version;
    TimePoint backup_time{};
    std::uint64_t size = 0;
    std::string checksum;
};

} // namespace selfupdate
