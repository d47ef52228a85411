#include "storage/storage_factory.hpp"

#include "crypto/sha256.hpp"
#include "pack/package.hpp"
#include "storage/archive_storage.hpp"
#include "storage/directory_storage.hpp"
#include "util/logger.hpp"

namespace staticfs {

namespace {

Result VerifyDigest(const Package& package, const std::string& expected) {
    if (expected.empty()) return Result::Ok();

    const std::string actual = Sha256Hex(package.Bytes());
    if (actual.empty()) {
        return Result::Fail(Errc::IoFailure, "sha256 failed");
    }
    if (!Sha256Equal(actual, expected)) {
        return Result::Fail(Errc::MalformedPackage,
                            "package sha256 mismatch: expected " + expected + ", got " + actual);
    }
    LogInfo("package sha256 verified: %s", actual.c_str());
    return Result::Ok();
}

} // namespace

Result OpenStorage(const ServerConfig& cfg, std::span<const std::uint8_t> embedded,
                   std::shared_ptr<const IStorage>& out) {
    switch (cfg.source) {
        case SourceType::Directory: {
            auto storage = std::make_shared<DirectoryStorage>();
            if (auto r = DirectoryStorage::OpenRoot(cfg.root, *storage); !r.ok) return r;
            LogInfo("serving directory %s", storage->Root().c_str());
            out = std::move(storage);
            return Result::Ok();
        }
        case SourceType::Package: {
            auto package = std::make_shared<Package>();
            if (auto r = Package::LoadFile(cfg.package, *package); !r.ok) return r;
            if (auto r = VerifyDigest(*package, cfg.package_sha256); !r.ok) return r;
            out = std::make_shared<ArchiveStorage>(std::move(package));
            return Result::Ok();
        }
        case SourceType::Embedded: {
            auto package = std::make_shared<Package>();
            if (auto r = Package::FromBytes(embedded, *package); !r.ok) return r;
            if (auto r = VerifyDigest(*package, cfg.package_sha256); !r.ok) return r;
            LogInfo("serving embedded package: %zu entries", package->Entries().size());
            out = std::make_shared<ArchiveStorage>(std::move(package));
            return Result::Ok();
        }
    }
    return Result::Fail(Errc::InvalidArgument, "unknown storage source");
}

} // namespace staticfs
