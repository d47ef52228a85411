#include "util/http_date.hpp"

#include <ctime>

namespace staticfs {

std::string FormatHttpDate(std::int64_t epoch_seconds) {
    const std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm{};
    if (gmtime_r(&t, &tm) == nullptr) return {};

    char buf[64]{};
    const size_t n = std::strftime(buf, sizeof(buf), kHttpDateFormat, &tm);
    return std::string(buf, n);
}

std::optional<std::int64_t> ParseHttpDate(std::string_view value) {
    const std::string s(value);
    std::tm tm{};
    const char* end = ::strptime(s.c_str(), kHttpDateFormat, &tm);
    if (end == nullptr || *end != '\0') return std::nullopt;

    return static_cast<std::int64_t>(::timegm(&tm));
}

} // namespace staticfs
