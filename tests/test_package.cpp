#include "pack/byte_order.hpp"
#include "pack/package.hpp"
#include "pack/package_writer.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace staticfs {

namespace {

std::vector<std::uint8_t> Encode(const std::vector<std::pair<std::string, std::string>>& files,
                                 std::int64_t mtime = 1700000000) {
    PackageWriter writer;
    for (const auto& [path, content] : files) {
        auto r = writer.AddMemory(path, mtime, testutil::Bytes(content));
        EXPECT_TRUE(r.ok) << r.msg;
    }
    testutil::BufferWriter out;
    auto r = writer.Write(out);
    EXPECT_TRUE(r.ok) << r.msg;
    return out.data;
}

// One hand-built record.
void AppendRecord(std::vector<std::uint8_t>& meta, const std::string& path, std::int64_t mtime,
                  std::uint64_t length, std::uint64_t offset) {
    std::uint8_t word[8];
    PutU64BE(path.size(), word);
    meta.insert(meta.end(), word, word + 8);
    meta.insert(meta.end(), path.begin(), path.end());
    PutU64BE(static_cast<std::uint64_t>(mtime), word);
    meta.insert(meta.end(), word, word + 8);
    PutU64BE(length, word);
    meta.insert(meta.end(), word, word + 8);
    PutU64BE(offset, word);
    meta.insert(meta.end(), word, word + 8);
}

std::vector<std::uint8_t> Assemble(const std::vector<std::uint8_t>& meta, const std::string& data) {
    std::vector<std::uint8_t> out(8);
    PutU64BE(meta.size(), out.data());
    out.insert(out.end(), meta.begin(), meta.end());
    out.insert(out.end(), data.begin(), data.end());
    return out;
}

std::string ReadEntry(const Package& package, const std::string& path) {
    std::unique_ptr<SliceReader> reader;
    auto r = package.Open(path, reader);
    EXPECT_TRUE(r.ok) << r.msg;
    if (!reader) return {};
    return testutil::ReadAll(*reader);
}

} // namespace

TEST(PackageTest, EncodedEntriesDecodeWithContent) {
    const auto bytes = Encode({{"index.html", "<h1>hi</h1>"}, {"css/site.css", "body{}"}, {"empty.txt", ""}});

    Package package;
    auto r = Package::FromBuffer(bytes, package);
    ASSERT_TRUE(r.ok) << r.msg;

    ASSERT_EQ(package.Entries().size(), 3u);
    EXPECT_EQ(ReadEntry(package, "index.html"), "<h1>hi</h1>");
    EXPECT_EQ(ReadEntry(package, "css/site.css"), "body{}");
    EXPECT_EQ(ReadEntry(package, "empty.txt"), "");

    const PackageEntry* entry = package.Find("css/site.css");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->last_modified, 1700000000);
    EXPECT_EQ(entry->length, 6u);
}

TEST(PackageTest, OutputDoesNotDependOnInsertionOrder) {
    const auto a = Encode({{"b.txt", "bbb"}, {"a.txt", "a"}, {"c/d.txt", "dd"}});
    const auto b = Encode({{"c/d.txt", "dd"}, {"a.txt", "a"}, {"b.txt", "bbb"}});
    EXPECT_EQ(a, b);
}

TEST(PackageTest, EntriesTileTheDataRegionInPathOrder) {
    const auto bytes = Encode({{"z.bin", "zzzz"}, {"a.bin", "a"}, {"m.bin", "mmm"}});

    Package package;
    ASSERT_TRUE(Package::FromBuffer(bytes, package).ok);

    std::uint64_t expected_offset = 0;
    for (const auto& [path, entry] : package.Entries()) {
        EXPECT_EQ(entry.start_offset, expected_offset) << path;
        expected_offset += entry.length;
    }
    EXPECT_EQ(expected_offset, package.DataSize());
}

TEST(PackageTest, DataRegionStartsAfterMetadata) {
    const auto bytes = Encode({{"only.txt", "XYZ"}});

    const std::uint64_t meta_len = GetU64BE(bytes.data());
    EXPECT_EQ(meta_len, kPackageRecordFixedSize + std::string("only.txt").size());
    ASSERT_EQ(bytes.size(), kPackageHeaderSize + meta_len + 3);
    EXPECT_EQ(bytes[kPackageHeaderSize + meta_len], 'X');

    Package package;
    ASSERT_TRUE(Package::FromBytes(bytes, package).ok);
    EXPECT_EQ(package.MetadataSize(), meta_len);
    EXPECT_EQ(package.DataSize(), 3u);
    EXPECT_EQ(ReadEntry(package, "only.txt"), "XYZ");
}

TEST(PackageTest, EmptyPackageIsValid) {
    const auto bytes = Encode({});
    ASSERT_EQ(bytes.size(), kPackageHeaderSize);

    Package package;
    ASSERT_TRUE(Package::FromBuffer(bytes, package).ok);
    EXPECT_TRUE(package.Entries().empty());
}

TEST(PackageTest, TruncatedHeaderIsMalformed) {
    Package package;
    auto r = Package::FromBuffer({0, 0, 0}, package);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.code, Errc::MalformedPackage);
}

TEST(PackageTest, MetadataLengthPastEndIsMalformed) {
    std::vector<std::uint8_t> bytes(8 + 10);
    PutU64BE(11, bytes.data());

    Package package;
    auto r = Package::FromBuffer(bytes, package);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.code, Errc::MalformedPackage);
}

TEST(PackageTest, HugeMetadataLengthIsMalformed) {
    std::vector<std::uint8_t> bytes(8);
    PutU64BE(UINT64_MAX, bytes.data());

    Package package;
    EXPECT_EQ(Package::FromBuffer(bytes, package).code, Errc::MalformedPackage);
}

TEST(PackageTest, PartialRecordIsMalformed) {
    std::vector<std::uint8_t> meta;
    AppendRecord(meta, "a.txt", 0, 1, 0);
    meta.resize(meta.size() - 3);

    Package package;
    auto r = Package::FromBuffer(Assemble(meta, "a"), package);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.code, Errc::MalformedPackage);
}

TEST(PackageTest, PathLengthOverrunIsMalformed) {
    std::vector<std::uint8_t> meta;
    AppendRecord(meta, "a.txt", 0, 1, 0);
    PutU64BE(1000, meta.data());

    Package package;
    EXPECT_EQ(Package::FromBuffer(Assemble(meta, "a"), package).code, Errc::MalformedPackage);
}

TEST(PackageTest, EntryOutsideDataRegionIsMalformed) {
    std::vector<std::uint8_t> meta;
    AppendRecord(meta, "a.txt", 0, 4, 0);

    Package package;
    auto r = Package::FromBuffer(Assemble(meta, "abc"), package);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.code, Errc::MalformedPackage);

    std::vector<std::uint8_t> wrapping;
    AppendRecord(wrapping, "b.txt", 0, UINT64_MAX, 2);
    EXPECT_EQ(Package::FromBuffer(Assemble(wrapping, "abc"), package).code, Errc::MalformedPackage);
}

TEST(PackageTest, LaterDuplicateRecordWins) {
    std::vector<std::uint8_t> meta;
    AppendRecord(meta, "a.txt", 1, 2, 0);
    AppendRecord(meta, "a.txt", 2, 3, 2);

    Package package;
    ASSERT_TRUE(Package::FromBuffer(Assemble(meta, "xxyyy"), package).ok);
    ASSERT_EQ(package.Entries().size(), 1u);
    EXPECT_EQ(package.Find("a.txt")->last_modified, 2);
    EXPECT_EQ(ReadEntry(package, "a.txt"), "yyy");
}

TEST(PackageTest, OpenUnknownPathIsNotFound) {
    Package package;
    ASSERT_TRUE(Package::FromBuffer(Encode({{"a.txt", "a"}}), package).ok);

    std::unique_ptr<SliceReader> reader;
    auto r = package.Open("b.txt", reader);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.code, Errc::NotFound);
    EXPECT_EQ(package.Find("/a.txt"), nullptr);
}

TEST(PackageTest, ReaderSeeksWithinEntry) {
    Package package;
    ASSERT_TRUE(Package::FromBuffer(Encode({{"a.txt", "0123456789"}, {"b.txt", "after"}}), package).ok);

    std::unique_ptr<SliceReader> reader;
    ASSERT_TRUE(package.Open("a.txt", reader).ok);
    EXPECT_EQ(*reader->TotalSize(), 10u);

    ASSERT_TRUE(reader->Seek(7).ok);
    EXPECT_EQ(testutil::ReadAll(*reader), "789");

    ASSERT_TRUE(reader->Seek(10).ok);
    EXPECT_EQ(testutil::ReadAll(*reader), "");
    EXPECT_FALSE(reader->Seek(11).ok);
}

TEST(PackageTest, ReaderOutlivesPackage) {
    std::unique_ptr<SliceReader> reader;
    {
        Package package;
        ASSERT_TRUE(Package::FromBuffer(Encode({{"a.txt", "still here"}}), package).ok);
        ASSERT_TRUE(package.Open("a.txt", reader).ok);
    }
    EXPECT_EQ(testutil::ReadAll(*reader), "still here");
}

TEST(PackageTest, LoadFileReadsPackageFromDisk) {
    testutil::TemporaryDirectory tmp;
    const auto bytes = Encode({{"a.txt", "disk"}});
    testutil::WriteFile(tmp.Path() + "/site.pack", std::string(bytes.begin(), bytes.end()));

    Package package;
    auto r = Package::LoadFile(tmp.Path() + "/site.pack", package);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(ReadEntry(package, "a.txt"), "disk");

    EXPECT_EQ(Package::LoadFile(tmp.Path() + "/missing.pack", package).code, Errc::NotFound);
}

} // namespace staticfs
