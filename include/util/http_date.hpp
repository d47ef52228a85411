#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace staticfs {

// strftime/strptime pattern shared by Last-Modified and If-Modified-Since.
inline constexpr const char* kHttpDateFormat = "%a, %d %b %Y %H:%M:%S GMT";

std::string FormatHttpDate(std::int64_t epoch_seconds);

// Returns nullopt if `value` does not match kHttpDateFormat exactly.
std::optional<std::int64_t> ParseHttpDate(std::string_view value);

} // namespace staticfs
