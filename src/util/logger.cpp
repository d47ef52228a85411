#include "util/logger.hpp"

#include <cstring>
#include <ctime>

namespace staticfs {

namespace {

// Fixed width keeps messages aligned.
const char* Tag(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
        default:              return "LOG  ";
    }
}

const char* BaseName(const char* file) {
    if (!file || *file == '\0') return nullptr;
    const char* slash = std::strrchr(file, '/');
    return slash ? (slash + 1) : file;
}

} // namespace

bool ParseLogLevel(const std::string& name, LogLevel& out) {
    for (LogLevel lvl : {LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error, LogLevel::None}) {
        if (name == LogLevelName(lvl)) {
            out = lvl;
            return true;
        }
    }
    return false;
}

const char* LogLevelName(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::None:  return "none";
    }
    return "unknown";
}

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

void Logger::SetStream(std::FILE* stream) {
    std::lock_guard<std::mutex> lk(mu_);
    stream_ = stream;
}

void Logger::Write(LogLevel lvl, const char* file, int line, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VWrite(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::VWrite(LogLevel lvl, const char* file, int line, const char* fmt, va_list ap) {
    if (!Enabled(lvl)) return;

    char ts[32]{};
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (gmtime_r(&now, &tm) != nullptr) {
        std::strftime(ts, sizeof(ts), "%Y-%m-%dT%H:%M:%SZ", &tm);
    }

    std::lock_guard<std::mutex> lk(mu_);
    std::FILE* out = stream_ ? stream_ : stderr;
    std::fprintf(out, "%s %s ", ts, Tag(lvl));
    if (const char* base = BaseName(file); base && line > 0) {
        std::fprintf(out, "[%s:%d] ", base, line);
    }
    std::vfprintf(out, fmt, ap);
    std::fputc('\n', out);
    std::fflush(out);
}

} // namespace staticfs
