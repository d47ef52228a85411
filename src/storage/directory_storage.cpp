#include "storage/directory_storage.hpp"

#include "io/file_reader.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace staticfs {

Result DirectoryStorage::OpenRoot(const std::string& root, DirectoryStorage& out) {
    std::error_code ec;
    fs::path canonical = fs::canonical(root, ec);
    if (ec) {
        return Result::Fail(Errc::NotFound, ec.value(), "cannot resolve root " + root + ": " + ec.message());
    }
    if (!fs::is_directory(canonical, ec)) {
        return Result::Fail(Errc::NotFound, "root is not a directory: " + root);
    }
    out.root_ = std::move(canonical);
    return Result::Ok();
}

fs::path DirectoryStorage::Resolve(std::string_view path) const {
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(root_ / fs::path(std::string(path)), ec);
    if (ec) return {};
    return resolved;
}

bool DirectoryStorage::IsBelowRoot(const fs::path& resolved) const {
    if (resolved.empty() || root_.empty()) return false;
    auto [root_it, path_it] = std::mismatch(root_.begin(), root_.end(), resolved.begin(), resolved.end());
    return root_it == root_.end();
}

bool DirectoryStorage::PathIsWithinRoot(std::string_view path) const {
    return IsBelowRoot(Resolve(path));
}

bool DirectoryStorage::Exists(std::string_view path) const {
    const fs::path resolved = Resolve(path);
    if (!IsBelowRoot(resolved)) return false;

    struct stat st{};
    return ::stat(resolved.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

Result DirectoryStorage::Metadata(std::string_view path, FileMetadata& out) const {
    const fs::path resolved = Resolve(path);
    if (!IsBelowRoot(resolved)) {
        return Result::Fail(Errc::PathOutsideRoot, "outside root: " + std::string(path));
    }

    struct stat st{};
    if (::stat(resolved.c_str(), &st) != 0) {
        const int e = errno;
        return Result::Fail(e == ENOENT ? Errc::NotFound : Errc::IoFailure, e,
                            "cannot stat " + resolved.string() + " (" + std::strerror(e) + ")");
    }
    if (!S_ISREG(st.st_mode)) {
        return Result::Fail(Errc::NotFound, "not a regular file: " + resolved.string());
    }

    out.last_modified = static_cast<std::int64_t>(st.st_mtim.tv_sec);
    out.length = static_cast<std::uint64_t>(st.st_size);
    return Result::Ok();
}

Result DirectoryStorage::Open(std::string_view path, std::optional<std::uint64_t> start,
                              std::unique_ptr<IReader>& out) const {
    const fs::path resolved = Resolve(path);
    if (!IsBelowRoot(resolved)) {
        return Result::Fail(Errc::PathOutsideRoot, "outside root: " + std::string(path));
    }

    auto reader = std::make_unique<FileReader>();
    if (auto r = FileReader::Open(resolved.string(), *reader); !r.ok) return r;

    // Only regular files report a size.
    if (!reader->TotalSize()) {
        return Result::Fail(Errc::NotFound, "not a regular file: " + resolved.string());
    }

    if (start) {
        if (auto r = reader->Seek(*start); !r.ok) return r;
    }

    out = std::move(reader);
    return Result::Ok();
}

} // namespace staticfs
