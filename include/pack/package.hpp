#pragma once

#include "io/slice_reader.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/* package layout, all integers big-endian:
 * [header
 *   8 bytes meta_len: size of the record area that follows
 * ]
 * [records, meta_len bytes in total, sorted by path
 *   8 bytes path length
 *   n bytes path (utf-8, '/' separated, relative, no terminator)
 *   8 bytes last modified (signed, epoch seconds utc)
 *   8 bytes content length
 *   8 bytes content offset, relative to the data region
 * ]
 * [data region
 *   file contents back to back in record order, no padding
 * ]
 */

namespace staticfs {

inline constexpr std::uint64_t kPackageHeaderSize = 8;
// path length + last modified + length + offset
inline constexpr std::uint64_t kPackageRecordFixedSize = 32;

struct PackageEntry {
    std::string path;
    std::int64_t last_modified = 0;
    std::uint64_t length = 0;
    std::uint64_t start_offset = 0;
};

// Decoded, immutable package. Copies share the underlying bytes.
class Package {
public:
    using Index = std::map<std::string, PackageEntry, std::less<>>;

    // Borrows `bytes`; they must outlive the package and every reader opened
    // from it (meant for data compiled into the binary).
    static Result FromBytes(std::span<const std::uint8_t> bytes, Package& out);
    static Result FromBuffer(std::vector<std::uint8_t> bytes, Package& out);
    static Result LoadFile(const std::string& path, Package& out);

    const PackageEntry* Find(std::string_view path) const;

    // Cursor over the entry's bytes; fails with NotFound for unknown paths.
    Result Open(std::string_view path, std::unique_ptr<SliceReader>& out) const;

    const Index& Entries() const { return index_; }
    std::uint64_t MetadataSize() const { return meta_len_; }
    std::uint64_t DataSize() const { return data_.size(); }
    // The whole container, header included.
    std::span<const std::uint8_t> Bytes() const { return bytes_; }

private:
    Result Decode();

    std::shared_ptr<const std::vector<std::uint8_t>> owned_;
    std::span<const std::uint8_t> bytes_;
    std::span<const std::uint8_t> data_;
    std::uint64_t meta_len_ = 0;
    Index index_;
};

} // namespace staticfs
