#pragma once

#include <cstdarg>
#include <optional>
#include <string>
#include <string_view>

namespace diagpack {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

const char* LogLevelName(LogLevel lvl);
// Accepts "debug", "info", "warn"/"warning", "error", "none" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view name);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // printf-style logging
    void Log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void VLog(LogLevel lvl, const char* fmt, va_list ap);
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

#define LogDebug(...) ::diagpack::Logger::Instance().LogWithSource(::diagpack::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::diagpack::Logger::Instance().LogWithSource(::diagpack::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::diagpack::Logger::Instance().LogWithSource(::diagpack::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::diagpack::Logger::Instance().LogWithSource(::diagpack::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace diagpack
