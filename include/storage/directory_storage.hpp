#pragma once

#include "storage/storage.hpp"

#include <filesystem>
#include <string>

namespace staticfs {

// Serves files below a directory. A fresh descriptor is opened per request.
class DirectoryStorage final : public IStorage {
public:
    DirectoryStorage() = default;

    // Fails with NotFound when `root` is not an existing directory.
    static Result OpenRoot(const std::string& root, DirectoryStorage& out);

    bool Exists(std::string_view path) const override;
    Result Metadata(std::string_view path, FileMetadata& out) const override;
    Result Open(std::string_view path, std::optional<std::uint64_t> start,
                std::unique_ptr<IReader>& out) const override;
    bool PathIsWithinRoot(std::string_view path) const override;

    const std::filesystem::path& Root() const { return root_; }

private:
    // Canonical form of root_/path; empty when it cannot be resolved.
    std::filesystem::path Resolve(std::string_view path) const;
    bool IsBelowRoot(const std::filesystem::path& resolved) const;

    std::filesystem::path root_;
};

} // namespace staticfs
