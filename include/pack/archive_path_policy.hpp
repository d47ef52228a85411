#pragma once

#include "util/result.hpp"

#include <string>

namespace staticfs {

// Decides which entry names may be enrolled into a package.
class ArchivePathPolicy {
  public:
    explicit ArchivePathPolicy(bool safe_paths_only = true) : safe_paths_only_(safe_paths_only) {}

    // Normalizes `raw_path` into `out_relative`. An empty result or "." is
    // accepted and left to the caller to skip.
    Result NormalizeEntryPath(const char* raw_path, std::string& out_relative) const;

    static bool IsSafeRelativePath(const std::string& p);

  private:
    bool safe_paths_only_ = true;
};

} // namespace staticfs
