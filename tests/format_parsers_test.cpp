#include <gtest/gtest.h>
#include "format_fixtures.hpp"

namespace {

using namespace testing_support;
using namespace fixtures;

const ScanResult* childNamed(const ScanResult& node, const std::string& hint) {
    for (const auto& child : node.children)
        if (child.pathHint == hint)
            return &child;
    return nullptr;
}

std::vector<uint8_t> embed(const std::vector<uint8_t>& image, size_t before, size_t after, uint8_t fill = 0xEE) {
    std::vector<uint8_t> out(before, fill);
    out.insert(out.end(), image.begin(), image.end());
    out.insert(out.end(), after, fill);
    return out;
}

std::string str(const MetaValue& v) { return metaToString(v); }

TEST(FormatParsersTest, BmpIsCarvedAtItsDeclaredSize) {
    ScanReport report = scanWithRegistry(embed(bmpImage(), 100, 130));

    ASSERT_EQ(report.root.children.size(), 3u);
    const ScanResult& bmp = report.root.children[1];
    EXPECT_EQ(bmp.type, "bmp");
    EXPECT_EQ(bmp.offset, 100u);
    EXPECT_EQ(bmp.length, 70u);
    EXPECT_TRUE(bmp.hasLabel("graphics"));
    EXPECT_EQ(std::get<int64_t>(bmp.metadata.at("width")), 2);
    EXPECT_EQ(std::get<uint64_t>(bmp.metadata.at("bpp")), 24u);
    EXPECT_TRUE(report.root.children[0].hasLabel(label::unrecognized));
    EXPECT_TRUE(report.root.children[2].hasLabel(label::unrecognized));
}

TEST(FormatParsersTest, BmpWithWrongPlaneCountIsIgnored) {
    std::vector<uint8_t> img = bmpImage();
    put_le16(img, 26, 3);
    ScanReport report = scanWithRegistry(embed(img, 10, 10));

    EXPECT_EQ(findArtifact(report.root, "bmp"), nullptr);
    EXPECT_TRUE(report.root.hasLabel(label::unrecognized));
}

TEST(FormatParsersTest, HuaweiBootImageExposesNamedPartitions) {
    ScanReport report = scanWithRegistry(huaweiBootImage());

    const ScanResult* boot = findArtifact(report.root, "androidboothuawei");
    ASSERT_NE(boot, nullptr);
    EXPECT_EQ(boot->offset, 0u);
    EXPECT_EQ(boot->length, 632u);
    EXPECT_EQ(str(boot->metadata.at("version")), "1.2");
    EXPECT_EQ(str(boot->metadata.at("image_version")), "HW-BOOT-7.0");
    EXPECT_EQ(std::get<uint64_t>(boot->metadata.at("partition_count")), 3u);

    // The nameless entry and the empty slot produce no children
    ASSERT_EQ(boot->children.size(), 2u);
    const ScanResult* sbl1 = childNamed(*boot, "sbl1");
    ASSERT_NE(sbl1, nullptr);
    EXPECT_EQ(sbl1->offset, 512u);
    EXPECT_EQ(sbl1->length, 80u);
    EXPECT_EQ(sbl1->depth, 1u);
    ASSERT_EQ(sbl1->children.size(), 2u);
    EXPECT_EQ(sbl1->children[0].type, "bmp");
    EXPECT_EQ(sbl1->children[0].length, 70u);
    EXPECT_EQ(sbl1->children[1].offset, 70u);

    const ScanResult* aboot = childNamed(*boot, "aboot");
    ASSERT_NE(aboot, nullptr);
    EXPECT_EQ(aboot->offset, 592u);
    EXPECT_TRUE(aboot->hasLabel(label::unrecognized));

    ASSERT_EQ(report.root.children.size(), 2u);
    EXPECT_EQ(report.root.children[1].offset, 632u);
    EXPECT_EQ(report.root.children[1].length, 68u);
}

TEST(FormatParsersTest, HuaweiRejectsUnexpectedMetaHeaderSize) {
    ScanReport report = scanWithRegistry(huaweiBootImage(80));

    EXPECT_EQ(findArtifact(report.root, "androidboothuawei"), nullptr);
    // The BMP inside the first partition is still found by the sweep
    const ScanResult* bmp = findArtifact(report.root, "bmp");
    ASSERT_NE(bmp, nullptr);
    EXPECT_EQ(bmp->offset, 512u);
}

TEST(FormatParsersTest, HuaweiEntryBeyondTheDataIsAMismatch) {
    std::vector<uint8_t> img = huaweiBootImage();
    put_le32(img, 84 + 72, 4096);
    ScanReport report = scanWithRegistry(img);

    EXPECT_EQ(findArtifact(report.root, "androidboothuawei"), nullptr);
}

TEST(FormatParsersTest, HuaweiOverlappingEntriesAreAMismatch) {
    std::vector<uint8_t> img = huaweiBootImage();
    put_le32(img, 84 + 80 + 72, 560);   // aboot starts inside sbl1
    ScanReport report = scanWithRegistry(img);

    EXPECT_EQ(findArtifact(report.root, "androidboothuawei"), nullptr);
    EXPECT_TRUE(report.failures.poisoned.empty());
    EXPECT_EQ(report.failures.contractViolations, 0u);
}

TEST(FormatParsersTest, TarMembersBecomeChildren) {
    std::vector<uint8_t> archive = tarArchive("docs/readme.txt", "hello world");
    ASSERT_EQ(archive.size(), 2560u);
    ScanReport report = scanWithRegistry(embed(archive, 0, 100, 0x00));

    const ScanResult* tar = findArtifact(report.root, "tar");
    ASSERT_NE(tar, nullptr);
    EXPECT_EQ(tar->offset, 0u);
    EXPECT_EQ(tar->length, 2560u);
    EXPECT_EQ(std::get<uint64_t>(tar->metadata.at("entries")), 2u);
    EXPECT_TRUE(std::get<bool>(tar->metadata.at("terminated")));

    ASSERT_EQ(tar->children.size(), 1u);
    EXPECT_EQ(tar->children[0].pathHint, "docs/readme.txt");
    EXPECT_EQ(tar->children[0].offset, 1024u);
    EXPECT_EQ(tar->children[0].length, 11u);
}

TEST(FormatParsersTest, TarSweepResumesAfterABadHeaderChecksum) {
    std::vector<uint8_t> archive = tarArchive("a.txt", "abc");
    archive[148] = '7';
    ScanReport report = scanWithRegistry(archive);

    // The directory header is rejected, the file header behind it is not
    const ScanResult* tar = findArtifact(report.root, "tar");
    ASSERT_NE(tar, nullptr);
    EXPECT_EQ(tar->offset, 512u);
    EXPECT_EQ(tar->length, 2048u);
    EXPECT_EQ(std::get<uint64_t>(tar->metadata.at("entries")), 1u);
}

TEST(FormatParsersTest, TarBase256SizeNearTheLimitIsAMismatch) {
    // GNU base-256 size of 2^64 - 1, which wraps when rounded up to blocks
    std::vector<uint8_t> bogus = tarHeader("huge.bin", 0);
    const uint8_t field[12] = {0x80, 0, 0, 0, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
    std::copy(field, field + 12, bogus.begin() + 124);
    sealTarHeader(bogus);

    std::vector<uint8_t> bytes = bogus;
    bytes.resize(4096, 0);
    std::vector<uint8_t> archive = tarArchive("a.txt", "abc");
    bytes.insert(bytes.end(), archive.begin(), archive.end());
    ScanReport report = scanWithRegistry(bytes);

    const ScanResult* tar = findArtifact(report.root, "tar");
    ASSERT_NE(tar, nullptr);
    EXPECT_EQ(tar->offset, 4096u);
    EXPECT_EQ(tar->length, archive.size());
    EXPECT_TRUE(report.failures.poisoned.empty());
    EXPECT_EQ(report.failures.contractViolations, 0u);
}

TEST(FormatParsersTest, CpioNewcArchiveUpToTrailer) {
    std::vector<uint8_t> archive = cpioArchive("bin/init", "#!/bin/sh\n");
    ScanReport report = scanWithRegistry(embed(archive, 32, 64, 0x00));

    const ScanResult* cpio = findArtifact(report.root, "cpio");
    ASSERT_NE(cpio, nullptr);
    EXPECT_EQ(cpio->offset, 32u);
    EXPECT_EQ(cpio->length, archive.size());
    EXPECT_EQ(str(cpio->metadata.at("format")), "newc");

    // The directory entry carries no data
    ASSERT_EQ(cpio->children.size(), 1u);
    EXPECT_EQ(cpio->children[0].pathHint, "bin/init");
    EXPECT_EQ(cpio->children[0].length, 10u);
}

TEST(FormatParsersTest, CpioWithoutTrailerIsIgnored) {
    std::vector<uint8_t> archive;
    cpioEntry(archive, "bin/init", 0100755, "#!/bin/sh\n");
    ScanReport report = scanWithRegistry(archive);

    EXPECT_EQ(findArtifact(report.root, "cpio"), nullptr);
}

TEST(FormatParsersTest, GzipDecodesIntoAChildBuffer) {
    std::vector<uint8_t> gz = gzipOf(bmpImage());
    ScanReport report = scanWithRegistry(embed(gz, 16, 32));

    const ScanResult* gzip = findArtifact(report.root, "gzip");
    ASSERT_NE(gzip, nullptr);
    EXPECT_EQ(gzip->offset, 16u);
    EXPECT_EQ(gzip->length, gz.size());
    EXPECT_EQ(std::get<uint64_t>(gzip->metadata.at("uncompressed_size")), 70u);

    ASSERT_EQ(gzip->children.size(), 1u);
    const ScanResult& decoded = gzip->children[0];
    EXPECT_EQ(decoded.pathHint, "gzip.uncompressed");
    EXPECT_TRUE(std::get<bool>(decoded.metadata.at("decoded")));
    ASSERT_EQ(decoded.children.size(), 1u);
    EXPECT_EQ(decoded.children[0].type, "bmp");
    EXPECT_EQ(decoded.children[0].depth, 1u);
}

TEST(FormatParsersTest, TruncatedGzipIsIgnored) {
    std::vector<uint8_t> gz = gzipOf(std::vector<uint8_t>(4096, 'a'));
    gz.resize(gz.size() - 6);
    ScanReport report = scanWithRegistry(gz);

    EXPECT_EQ(findArtifact(report.root, "gzip"), nullptr);
}

TEST(FormatParsersTest, XzStreamStopsAtItsFooter) {
    std::vector<uint8_t> xz = xzOf(bmpImage());
    ScanReport report = scanWithRegistry(embed(xz, 0, 48, 0x11));

    const ScanResult* stream = findArtifact(report.root, "xz");
    ASSERT_NE(stream, nullptr);
    EXPECT_EQ(stream->length, xz.size());
    EXPECT_EQ(str(stream->metadata.at("check")), "crc32");
    ASSERT_EQ(stream->children.size(), 1u);
    EXPECT_EQ(stream->children[0].pathHint, "xz.uncompressed");
    EXPECT_NE(findArtifact(stream->children[0], "bmp"), nullptr);
}

TEST(FormatParsersTest, LzmaAloneStreamIsDecoded) {
    std::vector<uint8_t> lz = lzmaAloneOf(bmpImage());
    ScanReport report = scanWithRegistry(embed(lz, 8, 8, 0x11));

    const ScanResult* stream = findArtifact(report.root, "lzma");
    ASSERT_NE(stream, nullptr);
    EXPECT_EQ(stream->offset, 8u);
    EXPECT_EQ(stream->length, lz.size());
    EXPECT_EQ(std::get<uint64_t>(stream->metadata.at("dictionary_size")), 0x00800000u);
    ASSERT_EQ(stream->children.size(), 1u);
    EXPECT_EQ(stream->children[0].length, 70u);
}

TEST(FormatParsersTest, PngEndsAtIend) {
    std::vector<uint8_t> png = pngImage();
    ScanReport report = scanWithRegistry(embed(png, 5, 20));

    const ScanResult* image = findArtifact(report.root, "png");
    ASSERT_NE(image, nullptr);
    EXPECT_EQ(image->offset, 5u);
    EXPECT_EQ(image->length, png.size());
    EXPECT_EQ(std::get<uint64_t>(image->metadata.at("width")), 3u);
    EXPECT_EQ(std::get<uint64_t>(image->metadata.at("height")), 5u);
    EXPECT_EQ(std::get<uint64_t>(image->metadata.at("chunks")), 3u);
}

TEST(FormatParsersTest, PngWithCorruptChunkIsIgnored) {
    std::vector<uint8_t> png = pngImage();
    png[45] ^= 0xFF;   // IDAT data
    ScanReport report = scanWithRegistry(png);

    EXPECT_EQ(findArtifact(report.root, "png"), nullptr);
}

TEST(FormatParsersTest, UImagePayloadIsNamedAfterTheImage) {
    std::vector<uint8_t> payload(48, 0x5A);
    std::vector<uint8_t> img = uimageOf("Linux-4.14", payload);
    ScanReport report = scanWithRegistry(embed(img, 0, 16, 0x00));

    const ScanResult* u = findArtifact(report.root, "uimage");
    ASSERT_NE(u, nullptr);
    EXPECT_EQ(u->length, 64u + payload.size());
    EXPECT_EQ(str(u->metadata.at("name")), "Linux-4.14");
    EXPECT_EQ(str(u->metadata.at("os")), "Linux");

    ASSERT_EQ(u->children.size(), 1u);
    EXPECT_EQ(u->children[0].pathHint, "Linux-4.14");
    EXPECT_EQ(u->children[0].offset, 64u);
    EXPECT_EQ(u->children[0].length, payload.size());
}

TEST(FormatParsersTest, UImageWithBadDataCrcIsIgnored) {
    std::vector<uint8_t> img = uimageOf("kernel", std::vector<uint8_t>(32, 0x5A));
    img[70] ^= 1;
    ScanReport report = scanWithRegistry(img);

    EXPECT_EQ(findArtifact(report.root, "uimage"), nullptr);
}

TEST(FormatParsersTest, ZipMembersAreReadThroughLibzip) {
    std::vector<uint8_t> zip = storedZip("notes.txt", "stored member");
    ScanReport report = scanWithRegistry(embed(zip, 64, 64, 0x00));

    const ScanResult* archive = findArtifact(report.root, "zip");
    ASSERT_NE(archive, nullptr);
    EXPECT_EQ(archive->offset, 64u);
    EXPECT_EQ(archive->length, zip.size());
    EXPECT_EQ(std::get<uint64_t>(archive->metadata.at("entries")), 1u);

    ASSERT_EQ(archive->children.size(), 1u);
    EXPECT_EQ(archive->children[0].pathHint, "notes.txt");
    EXPECT_EQ(archive->children[0].length, 13u);
}

TEST(FormatParsersTest, ZipWithoutCentralDirectoryIsIgnored) {
    std::vector<uint8_t> zip = storedZip("notes.txt", "stored member");
    zip.resize(30 + 9 + 13);
    ScanReport report = scanWithRegistry(zip);

    EXPECT_EQ(findArtifact(report.root, "zip"), nullptr);
}

TEST(FormatParsersTest, MbrPartitionsAreScannedAsChildren) {
    ScanReport report = scanWithRegistry(mbrDisk());

    const ScanResult* mbr = findArtifact(report.root, "mbr");
    ASSERT_NE(mbr, nullptr);
    EXPECT_EQ(mbr->offset, 0u);
    EXPECT_EQ(mbr->length, 1536u);
    EXPECT_EQ(std::get<uint64_t>(mbr->metadata.at("partition_count")), 1u);

    ASSERT_EQ(mbr->children.size(), 1u);
    const ScanResult& part = mbr->children[0];
    EXPECT_EQ(part.pathHint, "partition0-Linux");
    EXPECT_EQ(part.offset, 512u);
    EXPECT_EQ(part.length, 1024u);
    ASSERT_FALSE(part.children.empty());
    EXPECT_EQ(part.children[0].type, "bmp");
}

TEST(FormatParsersTest, MbrWithOverlappingPartitionsIsIgnored) {
    std::vector<uint8_t> disk = mbrDisk();
    disk[462 + 4] = 0x83;
    put_le32(disk, 462 + 8, 2);     // sectors 2-3, inside partition 0
    put_le32(disk, 462 + 12, 2);
    ScanReport report = scanWithRegistry(disk);

    EXPECT_EQ(findArtifact(report.root, "mbr"), nullptr);
    EXPECT_TRUE(report.failures.poisoned.empty());
    EXPECT_EQ(report.failures.contractViolations, 0u);
    // The partition contents are still reached by the sweep
    const ScanResult* bmp = findArtifact(report.root, "bmp");
    ASSERT_NE(bmp, nullptr);
    EXPECT_EQ(bmp->offset, 512u);
}

TEST(FormatParsersTest, MbrWithBadBootIndicatorIsIgnored) {
    std::vector<uint8_t> disk = mbrDisk();
    disk[446] = 0x12;
    ScanReport report = scanWithRegistry(disk);

    EXPECT_EQ(findArtifact(report.root, "mbr"), nullptr);
}

} // namespace
