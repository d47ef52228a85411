#include "pack/archive_path_policy.hpp"

#include "util/path_utils.hpp"

#include <string_view>

namespace staticfs {

namespace {

bool HasParentSegment(std::string_view p) {
    size_t begin = 0;
    while (begin <= p.size()) {
        size_t end = p.find('/', begin);
        if (end == std::string_view::npos) end = p.size();
        if (p.substr(begin, end - begin) == "..") return true;
        begin = end + 1;
    }
    return false;
}

} // namespace

bool ArchivePathPolicy::IsSafeRelativePath(const std::string& p) {
    if (p.empty() || p.front() == '/') return false;
    if (p.find_first_of(std::string_view("\\\0", 2)) != std::string::npos) return false;
    return !HasParentSegment(p);
}

Result ArchivePathPolicy::NormalizeEntryPath(const char* raw_path, std::string& out_relative) const {
    out_relative = raw_path ? staticfs::NormalizeEntryPath(raw_path) : std::string();
    if (out_relative.empty() || out_relative == ".") return Result::Ok();

    if (safe_paths_only_ && !IsSafeRelativePath(out_relative)) {
        return Result::Fail(Errc::InvalidArgument, "Unsafe entry path: " + out_relative);
    }
    return Result::Ok();
}

} // namespace staticfs
