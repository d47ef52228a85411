#include "crypto/sha256.hpp"
#include "pack/package_writer.hpp"
#include "storage/archive_storage.hpp"
#include "storage/directory_storage.hpp"
#include "storage/storage_factory.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

namespace staticfs {

class StorageFactoryTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    std::vector<std::uint8_t> package_bytes;

    void SetUp() override {
        PackageWriter writer;
        ASSERT_TRUE(writer.AddMemory("index.html", 1600000000, testutil::Bytes("packed")).ok);
        testutil::BufferWriter out;
        ASSERT_TRUE(writer.Write(out).ok);
        package_bytes = out.data;

        testutil::WriteFile(tmp.Path() + "/site.pack", std::string(package_bytes.begin(), package_bytes.end()));
        testutil::WriteFile(tmp.Path() + "/www/index.html", "plain");
    }
};

TEST_F(StorageFactoryTest, DirectorySource) {
    ServerConfig cfg;
    cfg.source = SourceType::Directory;
    cfg.root = tmp.Path() + "/www";

    std::shared_ptr<const IStorage> storage;
    ASSERT_TRUE(OpenStorage(cfg, {}, storage).ok);
    ASSERT_NE(dynamic_cast<const DirectoryStorage*>(storage.get()), nullptr);
    EXPECT_TRUE(storage->Exists("index.html"));
}

TEST_F(StorageFactoryTest, MissingDirectoryFails) {
    ServerConfig cfg;
    cfg.root = tmp.Path() + "/nope";

    std::shared_ptr<const IStorage> storage;
    EXPECT_EQ(OpenStorage(cfg, {}, storage).code, Errc::NotFound);
    EXPECT_FALSE(storage);
}

TEST_F(StorageFactoryTest, PackageSourceWithMatchingDigest) {
    ServerConfig cfg;
    cfg.source = SourceType::Package;
    cfg.package = tmp.Path() + "/site.pack";
    cfg.package_sha256 = Sha256Hex(package_bytes);

    std::shared_ptr<const IStorage> storage;
    auto r = OpenStorage(cfg, {}, storage);
    ASSERT_TRUE(r.ok) << r.msg;
    ASSERT_NE(dynamic_cast<const ArchiveStorage*>(storage.get()), nullptr);

    std::unique_ptr<IReader> reader;
    ASSERT_TRUE(storage->Open("index.html", std::nullopt, reader).ok);
    EXPECT_EQ(testutil::ReadAll(*reader), "packed");
}

TEST_F(StorageFactoryTest, PackageDigestMismatchFails) {
    ServerConfig cfg;
    cfg.source = SourceType::Package;
    cfg.package = tmp.Path() + "/site.pack";
    cfg.package_sha256 = std::string(64, '0');

    std::shared_ptr<const IStorage> storage;
    EXPECT_EQ(OpenStorage(cfg, {}, storage).code, Errc::MalformedPackage);
    EXPECT_FALSE(storage);
}

TEST_F(StorageFactoryTest, EmbeddedSourceUsesGivenBytes) {
    ServerConfig cfg;
    cfg.source = SourceType::Embedded;

    std::shared_ptr<const IStorage> storage;
    ASSERT_TRUE(OpenStorage(cfg, package_bytes, storage).ok);
    EXPECT_TRUE(storage->Exists("index.html"));
}

TEST_F(StorageFactoryTest, EmbeddedGarbageIsMalformed) {
    ServerConfig cfg;
    cfg.source = SourceType::Embedded;
    const std::vector<std::uint8_t> garbage = {1, 2, 3};

    std::shared_ptr<const IStorage> storage;
    EXPECT_EQ(OpenStorage(cfg, garbage, storage).code, Errc::MalformedPackage);
}

} // namespace staticfs
