#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace staticfs {

// Inclusive byte interval from a single-range "Range" header.
struct ByteRange {
    std::string unit;
    std::uint64_t start = 0;
    std::uint64_t end = 0;

    std::uint64_t Length() const { return end - start + 1; }
};

// Parses `unit=start-end`. Errors:
//   Errc::UnsupportedRange - several ranges (the value contains ',')
//   Errc::InvalidRange     - anything else that does not match, or end < start
std::expected<ByteRange, Errc> ParseRangeHeader(std::string_view value);

// Fits `range` to a resource of `size` bytes: nullopt when it starts at or
// past the end, otherwise the end is clamped to the last byte.
std::optional<ByteRange> FitRange(ByteRange range, std::uint64_t size);

std::string FormatContentRange(const ByteRange& range, std::uint64_t size);

} // namespace staticfs
