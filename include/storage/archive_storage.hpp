#pragma once

#include "pack/package.hpp"
#include "storage/storage.hpp"

#include <memory>

namespace staticfs {

// Serves the entries of a decoded package. Only enrolled paths resolve, so
// there is nothing outside the root to reach.
class ArchiveStorage final : public IStorage {
public:
    explicit ArchiveStorage(std::shared_ptr<const Package> package) : package_(std::move(package)) {}

    bool Exists(std::string_view path) const override;
    Result Metadata(std::string_view path, FileMetadata& out) const override;
    Result Open(std::string_view path, std::optional<std::uint64_t> start,
                std::unique_ptr<IReader>& out) const override;
    bool PathIsWithinRoot(std::string_view) const override { return true; }

    const Package& GetPackage() const { return *package_; }

private:
    std::shared_ptr<const Package> package_;
};

} // namespace staticfs
