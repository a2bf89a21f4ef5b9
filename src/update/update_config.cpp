#include "selfupdate/update/update_config.hpp"

#include "selfupdate/util/json_utils.hpp"
#include "selfupdate/util/logger.hpp"

#include <cerrno>
#include <filesystem>

namespace selfupdate {

using namespace jsonutil;

namespace {

constexpr std::string_view kChannels[] = {"stable", "beta", "alpha", "nightly", "dev"};
constexpr std::string_view kNotificationLevels[] = {"silent", "notify", "prompt"};

Result GetTimeIfPresent(const nlohmann::json& j, const char* key, std::optional<TimePoint>& out) {
    std::string text;
    if (!GetStringIfPresent(j, key, text) || text.empty()) return Result::Ok();
    TimePoint tp;
    if (!ParseRfc3339(text, tp)) {
        return Result::Fail(EINVAL, std::string("invalid timestamp for '") + key + "': " + text);
    }
    out = tp;
    return Result::Ok();
}

void PutTime(nlohmann::json& j, const char* key, const std::optional<TimePoint>& tp) {
    j[key] = tp ? FormatRfc3339(*tp) : std::string();
}

} // namespace

bool IsValidChannel(std::string_view channel) {
    for (auto c : kChannels) {
        if (c == channel) return true;
    }
    return false;
}

bool IsValidNotificationLevel(std::string_view level) {
    for (auto l : kNotificationLevels) {
        if (l == level) return true;
    }
    return false;
}

Result ParseUpdateConfig(const nlohmann::json& j, UpdateConfig& out) {
    if (!j.is_object()) return Result::Fail(EINVAL, "configuration root must be a JSON object");

    GetBoolIfPresent(j, "enabled", out.enabled);
    GetBoolIfPresent(j, "check_on_startup", out.check_on_startup);
    GetBoolIfPresent(j, "auto_install", out.auto_install);
    GetStringIfPresent(j, "channel", out.channel);
    GetStringIfPresent(j, "check_interval", out.check_interval);
    GetBoolIfPresent(j, "allow_prerelease", out.allow_prerelease);
    GetStringIfPresent(j, "github_repository", out.github_repository);
    GetStringIfPresent(j, "download_directory", out.download_directory);
    GetStringIfPresent(j, "release_feed", out.release_feed);
    GetStringIfPresent(j, "skip_version", out.skip_version);
    GetStringIfPresent(j, "notification_level", out.notification_level);
    GetStringIfPresent(j, "postponed_version", out.postponed_version);

    if (!IsValidChannel(out.channel)) {
        return Result::Fail(EINVAL, "invalid channel: " + out.channel);
    }
    if (!IsValidNotificationLevel(out.notification_level)) {
        return Result::Fail(EINVAL, "invalid notification level: " + out.notification_level);
    }

    auto r = GetTimeIfPresent(j, "last_check", out.last_check);
    if (!r.is_ok()) return r;
    return GetTimeIfPresent(j, "postponed_until", out.postponed_until);
}

nlohmann::json UpdateConfigToJson(const UpdateConfig& cfg) {
    nlohmann::json j = {
        {"enabled", cfg.enabled},
        {"check_on_startup", cfg.check_on_startup},
        {"auto_install", cfg.auto_install},
        {"channel", cfg.channel},
        {"check_interval", cfg.check_interval},
        {"allow_prerelease", cfg.allow_prerelease},
        {"github_repository", cfg.github_repository},
        {"download_directory", cfg.download_directory},
        {"release_feed", cfg.release_feed},
        {"skip_version", cfg.skip_version},
        {"notification_level", cfg.notification_level},
        {"postponed_version", cfg.postponed_version},
    };
    PutTime(j, "last_check", cfg.last_check);
    PutTime(j, "postponed_until", cfg.postponed_until);
    return j;
}

ConfigStore::ConfigStore() = default;

ConfigStore::ConfigStore(std::string path) : path_(std::move(path)) {}

Result ConfigStore::Load() {
    if (path_.empty()) return Result::Ok();

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        LogInfo("No update configuration at %s, writing defaults", path_.c_str());
        return Set(UpdateConfig{});
    }

    nlohmann::json doc;
    auto r = LoadJsonObjectFromFile(path_, doc);
    if (!r.is_ok()) return r;

    UpdateConfig cfg;
    r = ParseUpdateConfig(doc, cfg);
    if (!r.is_ok()) return Result::Fail(r.err, path_ + ": " + r.msg);

    std::lock_guard<std::mutex> lk(mu_);
    cfg_ = std::move(cfg);
    return Result::Ok();
}

UpdateConfig ConfigStore::Get() const {
    std::lock_guard<std::mutex> lk(mu_);
    return cfg_;
}

Result ConfigStore::Set(const UpdateConfig& cfg) {
    std::lock_guard<std::mutex> lk(mu_);
    return StoreLocked(cfg);
}

Result ConfigStore::Modify(const std::function<void(UpdateConfig&)>& fn) {
    std::lock_guard<std::mutex> lk(mu_);
    UpdateConfig next = cfg_;
    fn(next);
    return StoreLocked(next);
}

Result ConfigStore::StoreLocked(const UpdateConfig& cfg) {
    if (!path_.empty()) {
        auto r = WriteJsonFileAtomic(path_, UpdateConfigToJson(cfg));
        if (!r.is_ok()) return Result::Fail(r.err, "failed to save configuration: " + r.msg);
    }
    cfg_ = cfg;
    return Result::Ok();
}

} // namespace selfupdate
