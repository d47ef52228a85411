#include "pack/tar_import.hpp"

#include "util/logger.hpp"

#include <vector>

namespace staticfs {

TarBundleReader::~TarBundleReader() {
    if (ar_) {
        archive_read_free(ar_);
        ar_ = nullptr;
    }
}

Result TarBundleReader::Fail(const std::string& what) const {
    const char* em = ar_ ? archive_error_string(ar_) : nullptr;
    return Result::Fail(Errc::IoFailure, what + ": " + (em ? em : "unknown"));
}

Result TarBundleReader::Open(IReader& src) {
    if (opened_) return Result::Fail(Errc::InvalidArgument, "Bundle already opened");

    ar_ = archive_read_new();
    if (!ar_) return Result::Fail(Errc::IoFailure, "archive_read_new failed");

    archive_read_support_format_tar(ar_);
    archive_read_support_filter_gzip(ar_);

    struct Ctx {
        IReader* r = nullptr;
        std::vector<std::uint8_t> buf;
        explicit Ctx(IReader& rr) : r(&rr), buf(64 * 1024) {}
    };

    auto* ctx = new Ctx(src);

    auto read_cb = [](archive*, void* cd, const void** buff) -> la_ssize_t {
        auto* c = static_cast<Ctx*>(cd);
        const ssize_t n = c->r->Read(std::span<std::uint8_t>(c->buf.data(), c->buf.size()));
        if (n < 0) return -1;
        *buff = c->buf.data();
        return static_cast<la_ssize_t>(n); // 0 => EOF
    };

    // libarchive invokes the close callback on failed opens as well.
    auto close_cb = [](archive*, void* cd) -> int {
        delete static_cast<Ctx*>(cd);
        return ARCHIVE_OK;
    };

    if (archive_read_open2(ar_, ctx, /*open*/nullptr, read_cb, /*skip*/nullptr, close_cb) != ARCHIVE_OK) {
        Result r = Fail("archive_read_open2 failed");
        archive_read_free(ar_);
        ar_ = nullptr;
        return r;
    }

    opened_ = true;
    return Result::Ok();
}

Result TarBundleReader::Next(TarEntryInfo& out, bool& eof) {
    eof = false;
    if (!opened_ || !ar_) return Result::Fail(Errc::InvalidArgument, "Bundle not opened");

    if (in_entry_) {
        if (auto r = SkipCurrent(); !r.ok) return r;
    }

    while (true) {
        int r = archive_read_next_header(ar_, &cur_entry_);
        if (r == ARCHIVE_EOF) {
            eof = true;
            return Result::Ok();
        }
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return Fail("archive_read_next_header");
        }

        if (archive_entry_filetype(cur_entry_) != AE_IFREG) {
            archive_read_data_skip(ar_);
            continue;
        }

        const char* name = archive_entry_pathname(cur_entry_);
        out.name = name ? std::string(name) : std::string();
        out.size = static_cast<std::uint64_t>(archive_entry_size(cur_entry_));
        out.last_modified = archive_entry_mtime_is_set(cur_entry_)
                                ? static_cast<std::int64_t>(archive_entry_mtime(cur_entry_))
                                : 0;

        in_entry_ = true;
        return Result::Ok();
    }
}

Result TarBundleReader::SkipCurrent() {
    if (!in_entry_) return Result::Ok();
    if (archive_read_data_skip(ar_) != ARCHIVE_OK) {
        return Fail("archive_read_data_skip");
    }
    in_entry_ = false;
    return Result::Ok();
}

Result TarBundleReader::ReadCurrent(std::vector<std::uint8_t>& out) {
    if (!in_entry_) return Result::Fail(Errc::InvalidArgument, "No current entry");
    out.clear();
    if (auto sz = archive_entry_size(cur_entry_); sz > 0) {
        out.reserve(static_cast<size_t>(sz));
    }

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const la_ssize_t n = archive_read_data(ar_, buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) {
            return Fail("archive_read_data");
        }
        out.insert(out.end(), buf.begin(), buf.begin() + n);
    }

    in_entry_ = false;
    return Result::Ok();
}

Result ImportTarBundle(IReader& src, PackageWriter& writer) {
    TarBundleReader bundle;
    if (auto r = bundle.Open(src); !r.ok) return r;

    size_t imported = 0;
    while (true) {
        TarEntryInfo info;
        bool eof = false;
        if (auto r = bundle.Next(info, eof); !r.ok) return r;
        if (eof) break;

        std::vector<std::uint8_t> content;
        if (auto r = bundle.ReadCurrent(content); !r.ok) return r;

        if (auto r = writer.AddMemory(info.name, info.last_modified, std::move(content)); !r.ok) {
            return r;
        }
        LogDebug("imported %s (%llu bytes)", info.name.c_str(),
                 static_cast<unsigned long long>(info.size));
        ++imported;
    }

    LogInfo("imported %zu entries from tar bundle", imported);
    return Result::Ok();
}

} // namespace staticfs
