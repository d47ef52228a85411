#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace staticfs {

struct FileMetadata {
    std::int64_t last_modified = 0; // epoch seconds, utc
    std::uint64_t length = 0;
};

// Source of servable files, keyed by '/'-separated paths relative to the
// storage root. Implementations are safe to call from concurrent requests.
class IStorage {
public:
    virtual ~IStorage() = default;

    // True only for regular files.
    virtual bool Exists(std::string_view path) const = 0;
    virtual Result Metadata(std::string_view path, FileMetadata& out) const = 0;
    // Stream positioned at `start` (0 when absent).
    virtual Result Open(std::string_view path, std::optional<std::uint64_t> start,
                        std::unique_ptr<IReader>& out) const = 0;
    virtual bool PathIsWithinRoot(std::string_view path) const = 0;
};

} // namespace staticfs
