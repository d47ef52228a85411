#include "pack/package_writer.hpp"

#include "io/file_reader.hpp"
#include "pack/byte_order.hpp"
#include "pack/package.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cinttypes>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace staticfs {

namespace {

constexpr size_t kCopyChunk = 64 * 1024;

Result CopyFileContent(const PackageSource& src, IWriter& out, std::vector<std::uint8_t>& buf) {
    FileReader reader;
    if (auto r = FileReader::Open(src.file, reader); !r.ok) return r;

    std::uint64_t copied = 0;
    while (true) {
        const ssize_t n = reader.Read(buf);
        if (n == 0) break;
        if (n < 0) {
            return Result::Fail(Errc::IoFailure, errno,
                                "Read failed: " + src.file + " (" + std::strerror(errno) + ")");
        }
        copied += static_cast<std::uint64_t>(n);
        if (copied > src.length) break;
        if (auto r = out.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n))); !r.ok) {
            return r;
        }
    }

    if (copied != src.length) {
        return Result::Fail(Errc::IoFailure, src.file + " changed size while packing (expected " +
                                                 std::to_string(src.length) + " bytes)");
    }
    return Result::Ok();
}

} // namespace

Result PackageWriter::Enrol(PackageSource src) {
    std::string normalized;
    if (auto r = policy_.NormalizeEntryPath(src.path.c_str(), normalized); !r.ok) return r;
    if (normalized.empty() || normalized == ".") {
        return Result::Fail(Errc::InvalidArgument, "empty entry path");
    }
    if (!names_.insert(normalized).second) {
        return Result::Fail(Errc::InvalidArgument, "duplicate entry path: " + normalized);
    }

    src.path = std::move(normalized);
    entries_.push_back(std::move(src));
    return Result::Ok();
}

Result PackageWriter::AddFile(const std::string& root, const std::string& relative) {
    const std::string full = (fs::path(root) / relative).string();

    struct stat st{};
    if (::stat(full.c_str(), &st) != 0) {
        const int e = errno;
        return Result::Fail(e == ENOENT ? Errc::NotFound : Errc::IoFailure, e,
                            "cannot stat " + full + " (" + std::strerror(e) + ")");
    }
    if (!S_ISREG(st.st_mode)) {
        return Result::Fail(Errc::InvalidArgument, "not a regular file: " + full);
    }

    PackageSource src;
    src.path = relative;
    src.last_modified = static_cast<std::int64_t>(st.st_mtim.tv_sec);
    src.length = static_cast<std::uint64_t>(st.st_size);
    src.type = PackageSourceType::File;
    src.file = full;
    return Enrol(std::move(src));
}

Result PackageWriter::AddMemory(const std::string& path, std::int64_t last_modified,
                                std::vector<std::uint8_t> content) {
    PackageSource src;
    src.path = path;
    src.last_modified = last_modified;
    src.length = content.size();
    src.type = PackageSourceType::Memory;
    src.content = std::move(content);
    return Enrol(std::move(src));
}

Result PackageWriter::AddDirectory(const std::string& root) {
    std::vector<std::string> files;
    if (auto r = CollectRegularFiles(root, files); !r.ok) return r;

    for (const auto& f : files) {
        if (auto r = AddFile(root, f); !r.ok) return r;
    }
    return Result::Ok();
}

Result PackageWriter::Write(IWriter& out) {
    std::sort(entries_.begin(), entries_.end(),
              [](const PackageSource& a, const PackageSource& b) { return a.path < b.path; });

    std::uint64_t meta_len = 0;
    for (const auto& e : entries_) {
        meta_len += kPackageRecordFixedSize + e.path.size();
    }

    std::vector<std::uint8_t> meta(kPackageHeaderSize + meta_len);
    std::uint8_t* p = meta.data();
    PutU64BE(meta_len, p);
    p += 8;

    std::uint64_t data_offset = 0;
    for (const auto& e : entries_) {
        PutU64BE(e.path.size(), p);
        p += 8;
        std::memcpy(p, e.path.data(), e.path.size());
        p += e.path.size();
        PutU64BE(static_cast<std::uint64_t>(e.last_modified), p);
        p += 8;
        PutU64BE(e.length, p);
        p += 8;
        PutU64BE(data_offset, p);
        p += 8;
        data_offset += e.length;
    }

    if (auto r = out.WriteAll(meta); !r.ok) return r;

    std::vector<std::uint8_t> buf(kCopyChunk);
    for (const auto& e : entries_) {
        if (e.type == PackageSourceType::Memory) {
            if (auto r = out.WriteAll(e.content); !r.ok) return r;
        } else {
            if (auto r = CopyFileContent(e, out, buf); !r.ok) return r;
        }
    }

    LogDebug("wrote package: %zu entries, %" PRIu64 " metadata bytes, %" PRIu64 " data bytes",
             entries_.size(), meta_len, data_offset);
    return Result::Ok();
}

Result CollectRegularFiles(const std::string& dir, std::vector<std::string>& out_relative) {
    out_relative.clear();

    std::error_code ec;
    const fs::path root = fs::canonical(dir, ec);
    if (ec) {
        return Result::Fail(Errc::NotFound, ec.value(), "cannot resolve " + dir + ": " + ec.message());
    }

    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        return Result::Fail(Errc::IoFailure, ec.value(), "cannot walk " + dir + ": " + ec.message());
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return Result::Fail(Errc::IoFailure, ec.value(), "cannot walk " + dir + ": " + ec.message());
        }
        if (!it->is_regular_file(ec)) continue;
        out_relative.push_back(it->path().lexically_relative(root).generic_string());
    }
    if (ec) {
        return Result::Fail(Errc::IoFailure, ec.value(), "cannot walk " + dir + ": " + ec.message());
    }

    std::sort(out_relative.begin(), out_relative.end());
    return Result::Ok();
}

Result WritePackage(const std::string& root, const std::vector<std::string>& files, IWriter& out) {
    PackageWriter writer;
    for (const auto& f : files) {
        if (auto r = writer.AddFile(root, f); !r.ok) return r;
    }
    return writer.Write(out);
}

Result WritePackageFromDir(const std::string& dir, IWriter& out) {
    PackageWriter writer;
    if (auto r = writer.AddDirectory(dir); !r.ok) return r;
    return writer.Write(out);
}

} // namespace staticfs
