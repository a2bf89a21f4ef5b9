#pragma once

#include "selfupdate/util/result.hpp"

#include <cstdarg>
#include <string>
#include <string_view>

namespace selfupdate {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn", "error", "none" (case-insensitive).
bool ParseLogLevel(std::string_view text, LogLevel& out);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Lines are always written to stderr; when a log file is set they are
    // appended there too. An empty path closes the file.
    Result SetLogFile(const std::string& path);

    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

private:
    Logger() = default;
};

#define LogDebug(...) ::selfupdate::Logger::Instance().LogWithSource(::selfupdate::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::selfupdate::Logger::Instance().LogWithSource(::selfupdate::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::selfupdate::Logger::Instance().LogWithSource(::selfupdate::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::selfupdate::Logger::Instance().LogWithSource(::selfupdate::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace selfupdate
