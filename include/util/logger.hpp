#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

namespace staticfs {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn", "error", "none". Returns false otherwise.
bool ParseLogLevel(const std::string& name, LogLevel& out);
const char* LogLevelName(LogLevel lvl);

// Process-wide line logger. Lines look like
//   2024-01-02T03:04:05Z WARN  [static_file_server.cpp:91] message
// and go to stderr unless another stream is set.
class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl) { level_.store(static_cast<int>(lvl), std::memory_order_relaxed); }
    LogLevel Level() const { return static_cast<LogLevel>(level_.load(std::memory_order_relaxed)); }
    bool Enabled(LogLevel lvl) const { return lvl != LogLevel::None && lvl >= Level(); }

    // The stream is not owned. Null restores stderr.
    void SetStream(std::FILE* stream);

    void Write(LogLevel lvl, const char* file, int line, const char* fmt, ...)
        __attribute__((format(printf, 5, 6)));
    void VWrite(LogLevel lvl, const char* file, int line, const char* fmt, va_list ap);

private:
    Logger() = default;

    std::atomic<int> level_{static_cast<int>(LogLevel::Info)};
    std::mutex mu_;
    std::FILE* stream_ = nullptr;
};

#define STATICFS_LOG(lvl, ...)                                                     \
    do {                                                                           \
        if (::staticfs::Logger::Instance().Enabled(lvl))                           \
            ::staticfs::Logger::Instance().Write(lvl, __FILE__, __LINE__, __VA_ARGS__); \
    } while (0)

#define LogDebug(...) STATICFS_LOG(::staticfs::LogLevel::Debug, __VA_ARGS__)
#define LogInfo(...)  STATICFS_LOG(::staticfs::LogLevel::Info, __VA_ARGS__)
#define LogWarn(...)  STATICFS_LOG(::staticfs::LogLevel::Warn, __VA_ARGS__)
#define LogError(...) STATICFS_LOG(::staticfs::LogLevel::Error, __VA_ARGS__)

} // namespace staticfs
