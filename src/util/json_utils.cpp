#include "selfupdate/util/json_utils.hpp"

#include "selfupdate/io/fd.hpp"

#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace selfupdate::jsonutil {

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_boolean())
        return false;
    out = it->get<bool>();
    return true;
}

bool GetIntIfPresent(const nlohmann::json& j, const char* key, int& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_number_integer())
        return false;
    out = it->get<int>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!(it->is_number_unsigned() || it->is_number_integer()))
        return false;
    auto v = it->get<long long>();
    if (v < 0)
        return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

Result ParseJson(const std::string& text, const std::string& origin, nlohmann::json& out) {
    try {
        out = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        return Result::Fail(-1, "invalid JSON in " + origin + ": " + e.what());
    }
    return Result::Ok();
}

Result LoadJsonFromFile(const std::string& path, nlohmann::json& out) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(ENOENT, "cannot open " + path);
    }
    std::ostringstream ss;
    ss << is.rdbuf();
    return ParseJson(ss.str(), path, out);
}

Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out) {
    auto r = LoadJsonFromFile(path, out);
    if (!r.is_ok()) return r;
    if (!out.is_object()) {
        return Result::Fail(-1, "root must be JSON object: " + path);
    }
    return Result::Ok();
}

Result WriteJsonFileAtomic(const std::string& path, const nlohmann::json& j) {
    namespace fs = std::filesystem;

    const fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return Result::Fail(ec.value(), "cannot create directory " +
                                                target.parent_path().string() + ": " + ec.message());
        }
    }

    const std::string tmp = path + ".tmp";
    const std::string text = j.dump(2) + "\n";
    {
        Fd fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
        if (!fd.Valid()) return Result::FromErrno("open " + tmp);

        auto w = fd.WriteAll(text.data(), text.size());
        if (!w.is_ok()) {
            ::unlink(tmp.c_str());
            return w;
        }
        if (::fsync(fd.Get()) != 0) {
            auto r = Result::FromErrno("fsync " + tmp);
            ::unlink(tmp.c_str());
            return r;
        }
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        auto r = Result::FromErrno("rename " + tmp + " -> " + path);
        ::unlink(tmp.c_str());
        return r;
    }
    return Result::Ok();
}

} // namespace selfupdate::jsonutil
