#include "selfupdate/util/logger.hpp"

#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

namespace selfupdate {

namespace {
std::mutex g_mu;
LogLevel g_level = LogLevel::Info;
std::FILE* g_file = nullptr;

const char* LevelName(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "LOG";
    }
}

void FormatTimestamp(char* buf, size_t buf_len) {
    if (buf_len == 0) return;
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (localtime_r(&now, &tm) == nullptr) {
        buf[0] = '\0';
        return;
    }
    std::strftime(buf, buf_len, "%Y-%m-%d %H:%M:%S", &tm);
}

const char* SourceBaseName(const char* file) {
    if (!file || *file == '\0') return nullptr;
    const char* slash = std::strrchr(file, '/');
    return slash ? slash + 1 : file;
}

void WriteLine(std::FILE* out, const char* prefix, const char* body) {
    std::fputs(prefix, out);
    std::fputs(body, out);
    std::fputc('\n', out);
}

} // namespace

bool ParseLogLevel(std::string_view text, LogLevel& out) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lower == "debug") out = LogLevel::Debug;
    else if (lower == "info") out = LogLevel::Info;
    else if (lower == "warn" || lower == "warning") out = LogLevel::Warn;
    else if (lower == "error") out = LogLevel::Error;
    else if (lower == "none") out = LogLevel::None;
    else return false;
    return true;
}

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

void Logger::SetLevel(LogLevel lvl) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_level = lvl;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lk(g_mu);
    return g_level;
}

Result Logger::SetLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_mu);
    if (g_file) {
        std::fclose(g_file);
        g_file = nullptr;
    }
    if (path.empty()) return Result::Ok();

    g_file = std::fopen(path.c_str(), "a");
    if (!g_file) return Result::FromErrno("cannot open log file " + path);
    return Result::Ok();
}

void Logger::LogWithSource(LogLevel lvl,
                           const char* file,
                           int line,
                           const char* fmt,
                           ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::VLogWithSource(LogLevel lvl,
                            const char* file,
                            int line,
                            const char* fmt,
                            va_list ap) {
    std::lock_guard<std::mutex> lk(g_mu);
    if (lvl < g_level) return;

    char ts[32]{};
    FormatTimestamp(ts, sizeof(ts));

    char prefix[160]{};
    int used = 0;
    if (ts[0] != '\0') {
        used = std::snprintf(prefix, sizeof(prefix), "[%s] [%s] ", ts, LevelName(lvl));
    } else {
        used = std::snprintf(prefix, sizeof(prefix), "[%s] ", LevelName(lvl));
    }
    const char* base = SourceBaseName(file);
    if (base && line > 0 && used >= 0 && static_cast<size_t>(used) < sizeof(prefix)) {
        std::snprintf(prefix + used, sizeof(prefix) - static_cast<size_t>(used), "[%s:%d] ", base, line);
    }

    char body[2048]{};
    std::vsnprintf(body, sizeof(body), fmt, ap);

    WriteLine(stderr, prefix, body);
    if (g_file) {
        WriteLine(g_file, prefix, body);
        std::fflush(g_file);
    }
}

} // namespace selfupdate
