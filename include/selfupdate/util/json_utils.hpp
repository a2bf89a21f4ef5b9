#pragma once

#include "selfupdate/util/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace selfupdate::jsonutil {

// Each getter leaves `out` untouched and returns false when the key is
// missing or holds the wrong type.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out);
bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out);
bool GetIntIfPresent(const nlohmann::json& j, const char* key, int& out);
bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out);

Result ParseJson(const std::string& text, const std::string& origin, nlohmann::json& out);
Result LoadJsonFromFile(const std::string& path, nlohmann::json& out);
Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out);

// Writes `<path>.tmp`, fsyncs it and renames it over `path`. Parent
// directories are created as needed.
Result WriteJsonFileAtomic(const std::string& path, const nlohmann::json& j);

} // namespace selfupdate::jsonutil
