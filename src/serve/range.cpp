#include "serve/range.hpp"

#include <charconv>
#include <cstring>

namespace staticfs {

namespace {

std::string_view Trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

bool IsTokenChar(char c) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) return true;
    return c != '\0' && std::strchr("!#$%&'*+-.^_`|~", c) != nullptr;
}

bool ParseU64(std::string_view s, std::uint64_t& out) {
    if (s.empty()) return false;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, out, 10);
    return ec == std::errc() && ptr == last;
}

} // namespace

std::expected<ByteRange, Errc> ParseRangeHeader(std::string_view value) {
    const std::string_view s = Trim(value);
    if (s.find(',') != std::string_view::npos) {
        return std::unexpected(Errc::UnsupportedRange);
    }

    const auto eq = s.find('=');
    if (eq == std::string_view::npos) {
        return std::unexpected(Errc::InvalidRange);
    }

    const std::string_view unit = s.substr(0, eq);
    if (unit.empty()) {
        return std::unexpected(Errc::InvalidRange);
    }
    for (char c : unit) {
        if (!IsTokenChar(c)) return std::unexpected(Errc::InvalidRange);
    }

    const std::string_view bounds = s.substr(eq + 1);
    const auto dash = bounds.find('-');
    if (dash == std::string_view::npos) {
        return std::unexpected(Errc::InvalidRange);
    }

    ByteRange range;
    range.unit = std::string(unit);
    if (!ParseU64(bounds.substr(0, dash), range.start) || !ParseU64(bounds.substr(dash + 1), range.end)) {
        return std::unexpected(Errc::InvalidRange);
    }
    if (range.end < range.start) {
        return std::unexpected(Errc::InvalidRange);
    }
    return range;
}

std::optional<ByteRange> FitRange(ByteRange range, std::uint64_t size) {
    if (range.start >= size) return std::nullopt;
    if (range.end >= size) range.end = size - 1;
    return range;
}

std::string FormatContentRange(const ByteRange& range, std::uint64_t size) {
    return range.unit + " " + std::to_string(range.start) + "-" + std::to_string(range.end) + "/" +
           std::to_string(size);
}

} // namespace staticfs
