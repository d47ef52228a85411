#include "storage/archive_storage.hpp"

namespace staticfs {

bool ArchiveStorage::Exists(std::string_view path) const {
    return package_->Find(path) != nullptr;
}

Result ArchiveStorage::Metadata(std::string_view path, FileMetadata& out) const {
    const PackageEntry* entry = package_->Find(path);
    if (!entry) {
        return Result::Fail(Errc::NotFound, "no such entry: " + std::string(path));
    }
    out.last_modified = entry->last_modified;
    out.length = entry->length;
    return Result::Ok();
}

Result ArchiveStorage::Open(std::string_view path, std::optional<std::uint64_t> start,
                            std::unique_ptr<IReader>& out) const {
    std::unique_ptr<SliceReader> reader;
    if (auto r = package_->Open(path, reader); !r.ok) return r;

    if (start && *start > 0) {
        if (auto r = reader->Seek(*start); !r.ok) return r;
    }

    out = std::move(reader);
    return Result::Ok();
}

} // namespace staticfs
