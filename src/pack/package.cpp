#include "pack/package.hpp"

#include "io/file_reader.hpp"
#include "pack/byte_order.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cinttypes>

namespace staticfs {

namespace {

Result Malformed(const std::string& msg) {
    return Result::Fail(Errc::MalformedPackage, "malformed package: " + msg);
}

} // namespace

Result Package::FromBytes(std::span<const std::uint8_t> bytes, Package& out) {
    out = Package{};
    out.bytes_ = bytes;
    return out.Decode();
}

Result Package::FromBuffer(std::vector<std::uint8_t> bytes, Package& out) {
    out = Package{};
    out.owned_ = std::make_shared<const std::vector<std::uint8_t>>(std::move(bytes));
    out.bytes_ = std::span<const std::uint8_t>(*out.owned_);
    return out.Decode();
}

Result Package::LoadFile(const std::string& path, Package& out) {
    FileReader reader;
    if (auto r = FileReader::Open(path, reader); !r.ok) return r;

    std::vector<std::uint8_t> buf;
    if (auto sz = reader.TotalSize()) {
        buf.reserve(static_cast<size_t>(*sz));
    }

    std::vector<std::uint8_t> chunk(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(chunk);
        if (n == 0) break;
        if (n < 0) {
            return Result::Fail(Errc::IoFailure, errno, "Read failed: " + path);
        }
        buf.insert(buf.end(), chunk.begin(), chunk.begin() + n);
    }

    if (auto r = FromBuffer(std::move(buf), out); !r.ok) {
        return Result::Fail(r.code, r.msg + " (" + path + ")");
    }
    LogInfo("loaded package %s: %zu entries, %" PRIu64 " data bytes",
            path.c_str(), out.index_.size(), out.DataSize());
    return Result::Ok();
}

Result Package::Decode() {
    index_.clear();

    if (bytes_.size() < kPackageHeaderSize) {
        return Malformed("truncated header");
    }

    meta_len_ = GetU64BE(bytes_.data());
    if (meta_len_ > bytes_.size() - kPackageHeaderSize) {
        return Malformed("metadata length " + std::to_string(meta_len_) + " exceeds package size " +
                         std::to_string(bytes_.size()));
    }

    const std::uint64_t meta_end = kPackageHeaderSize + meta_len_;
    data_ = bytes_.subspan(static_cast<size_t>(meta_end));

    std::uint64_t pos = kPackageHeaderSize;
    while (pos < meta_end) {
        std::uint64_t remaining = meta_end - pos;
        if (remaining < 8) {
            return Malformed("partial record at offset " + std::to_string(pos));
        }
        const std::uint64_t path_len = GetU64BE(bytes_.data() + pos);
        pos += 8;
        remaining -= 8;

        if (path_len > remaining || remaining - path_len < kPackageRecordFixedSize - 8) {
            return Malformed("record at offset " + std::to_string(pos - 8) +
                             " overruns the metadata region");
        }

        PackageEntry entry;
        entry.path.assign(reinterpret_cast<const char*>(bytes_.data() + pos), static_cast<size_t>(path_len));
        pos += path_len;
        entry.last_modified = static_cast<std::int64_t>(GetU64BE(bytes_.data() + pos));
        pos += 8;
        entry.length = GetU64BE(bytes_.data() + pos);
        pos += 8;
        entry.start_offset = GetU64BE(bytes_.data() + pos);
        pos += 8;

        if (entry.start_offset > data_.size() || entry.length > data_.size() - entry.start_offset) {
            return Malformed("entry '" + entry.path + "' lies outside the data region");
        }

        // Later duplicates replace earlier ones.
        std::string key = entry.path;
        index_.insert_or_assign(std::move(key), std::move(entry));
    }

    return Result::Ok();
}

const PackageEntry* Package::Find(std::string_view path) const {
    auto it = index_.find(path);
    return it == index_.end() ? nullptr : &it->second;
}

Result Package::Open(std::string_view path, std::unique_ptr<SliceReader>& out) const {
    const PackageEntry* entry = Find(path);
    if (!entry) {
        return Result::Fail(Errc::NotFound, "no such entry: " + std::string(path));
    }

    out = std::make_unique<SliceReader>(
        data_.subspan(static_cast<size_t>(entry->start_offset), static_cast<size_t>(entry->length)),
        owned_);
    return Result::Ok();
}

} // namespace staticfs
