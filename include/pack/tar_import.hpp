#pragma once

#include "io/io.hpp"
#include "pack/package_writer.hpp"
#include "util/result.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cstdint>
#include <string>
#include <vector>

namespace staticfs {

struct TarEntryInfo {
    std::string name;
    std::uint64_t size = 0;
    std::int64_t last_modified = 0;
};

// Sequential reader over the regular files of a (optionally gzip compressed) tar stream.
class TarBundleReader {
public:
    TarBundleReader() = default;
    ~TarBundleReader();

    TarBundleReader(const TarBundleReader&) = delete;
    TarBundleReader& operator=(const TarBundleReader&) = delete;

    // `src` must outlive this reader.
    Result Open(IReader& src);

    // Move to next regular file entry.
    // Returns Ok + eof=true when end-of-archive.
    Result Next(TarEntryInfo& out, bool& eof);

    Result ReadCurrent(std::vector<std::uint8_t>& out);

    // Skip any remaining bytes of current entry.
    Result SkipCurrent();

private:
    Result Fail(const std::string& what) const;

    bool opened_ = false;
    struct archive* ar_ = nullptr;
    struct archive_entry* cur_entry_ = nullptr;
    bool in_entry_ = false;
};

// Enrols every regular file of the tar stream into `writer`.
Result ImportTarBundle(IReader& src, PackageWriter& writer);

} // namespace staticfs
