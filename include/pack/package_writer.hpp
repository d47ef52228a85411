#pragma once

#include "io/io.hpp"
#include "pack/archive_path_policy.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace staticfs {

enum class PackageSourceType {
    Memory,
    File // read lazily when writing
};

struct PackageSource {
    std::string path; // name inside the package
    std::int64_t last_modified = 0;
    std::uint64_t length = 0;
    PackageSourceType type = PackageSourceType::File;

    std::string file;                  // File
    std::vector<std::uint8_t> content; // Memory
};

// Collects entries and serializes them in path order.
class PackageWriter {
public:
    PackageWriter() = default;
    explicit PackageWriter(ArchivePathPolicy policy) : policy_(policy) {}

    // Enrols root/relative under the name `relative`. Size and mtime are
    // taken now, content is copied by Write().
    Result AddFile(const std::string& root, const std::string& relative);

    Result AddMemory(const std::string& path, std::int64_t last_modified,
                     std::vector<std::uint8_t> content);

    // Enrols every regular file below `root`.
    Result AddDirectory(const std::string& root);

    size_t EntryCount() const { return entries_.size(); }

    Result Write(IWriter& out);

private:
    Result Enrol(PackageSource src);

    ArchivePathPolicy policy_;
    std::vector<PackageSource> entries_;
    std::unordered_set<std::string> names_;
};

// Relative, '/'-separated paths of all regular files below `dir`, sorted.
Result CollectRegularFiles(const std::string& dir, std::vector<std::string>& out_relative);

Result WritePackage(const std::string& root, const std::vector<std::string>& files, IWriter& out);
Result WritePackageFromDir(const std::string& dir, IWriter& out);

} // namespace staticfs
