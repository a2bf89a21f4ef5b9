#pragma once

#include "selfupdate/util/result.hpp"
#include "selfupdate/util/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace selfupdate {

struct UpdateConfig {
    bool enabled = true;
    bool check_on_startup = true;
    bool auto_install = false;
    std::string channel = "stable";
    std::string check_interval = "daily";
    bool allow_prerelease = false;
    std::string github_repository = "deltacli/delta";
    std::string download_directory;
    std::string release_feed;
    std::optional<TimePoint> last_check;
    std::string skip_version;
    std::string notification_level = "prompt";
    std::string postponed_version;
    std::optional<TimePoint> postponed_until;
};

bool IsValidChannel(std::string_view channel);
bool IsValidNotificationLevel(std::string_view level);

// Unknown keys are ignored; keys of the wrong type keep their defaults.
// Malformed timestamps are an error.
Result ParseUpdateConfig(const nlohmann::json& j, UpdateConfig& out);
nlohmann::json UpdateConfigToJson(const UpdateConfig& cfg);

// Thread-safe holder of the configuration, optionally backed by a JSON file.
class ConfigStore {
  public:
    // In-memory only.
    ConfigStore();
    explicit ConfigStore(std::string path);

    // A missing file yields the defaults, which are written out.
    Result Load();

    UpdateConfig Get() const;
    // Replaces the configuration and persists it when file-backed. The
    // in-memory copy is only replaced when persisting succeeds.
    Result Set(const UpdateConfig& cfg);
    // Read-modify-write under the store lock.
    Result Modify(const std::function<void(UpdateConfig&)>& fn);

    const std::string& Path() const { return path_; }

  private:
    Result StoreLocked(const UpdateConfig& cfg);

    std::string path_;
    mutable std::mutex mu_;
    UpdateConfig cfg_;
};

} // namespace selfupdate
