#include <gtest/gtest.h>

#include "signature_index.hpp"
#include "test_support.hpp"

using namespace testing_support;

namespace {

TEST(SignatureIndex, FindsPatternsAtTheirAnchorOffset) {
    SignatureIndex index;
    index.add(0, Signature(0, std::string("PK\x03\x04")));
    index.add(1, Signature(257, std::string("ustar")));
    index.add(2, Signature(0, std::string("PK")));

    std::vector<uint8_t> bytes(600, 0);
    put(bytes, 10, "PK\x03\x04");
    put(bytes, 100 + 257, "ustar");
    ByteRegion r(bufferOf(bytes));

    EXPECT_EQ(index.candidatesAt(r, 10), (std::vector<size_t>{0, 2}));
    EXPECT_EQ(index.candidatesAt(r, 100), (std::vector<size_t>{1}));
    EXPECT_TRUE(index.candidatesAt(r, 11).empty());
    EXPECT_EQ(index.entryCount(), 3u);
    EXPECT_EQ(index.anchorCount(), 2u);
}

TEST(SignatureIndex, PatternThatWouldRunPastTheEndDoesNotMatch) {
    SignatureIndex index;
    index.add(0, Signature(257, std::string("ustar")));
    index.add(1, Signature(0, std::string("ABCD")));

    std::vector<uint8_t> bytes(260, 0);
    put(bytes, 257, "ust");
    put(bytes, 258, "AB");
    ByteRegion r(bufferOf(bytes));

    EXPECT_TRUE(index.candidatesAt(r, 0).empty());
    EXPECT_TRUE(index.candidatesAt(r, 258).empty());
    EXPECT_TRUE(index.candidatesAt(r, 260).empty());
}

TEST(SignatureIndex, ResultIsSortedAndUnique) {
    SignatureIndex index;
    index.add(5, Signature(0, std::string("0707")));
    index.add(5, Signature(0, std::string("07070")));
    index.add(1, Signature(0, std::string("07")));

    std::vector<uint8_t> bytes;
    put(bytes, 0, "070701");
    ByteRegion r(bufferOf(bytes));
    EXPECT_EQ(index.candidatesAt(r, 0), (std::vector<size_t>{1, 5}));
}

TEST(SignatureIndex, FallbacksOnlyAtRegionStart) {
    SignatureIndex index;
    index.add(1, Signature(0, std::string("MZ")));
    index.addFallback(0);
    index.addFallback(3);

    std::vector<uint8_t> bytes;
    put(bytes, 0, "MZ");
    ByteRegion r(bufferOf(bytes));

    EXPECT_EQ(index.candidatesAtStart(r), (std::vector<size_t>{0, 1, 3}));
    EXPECT_EQ(index.candidatesAt(r, 0), (std::vector<size_t>{1}));
    EXPECT_EQ(index.fallbacks().size(), 2u);
}

TEST(SignatureIndex, MinSpanIsTheSmallestOffsetPlusLength) {
    SignatureIndex index;
    EXPECT_EQ(index.minSpan(), 1u);
    index.add(0, Signature(510, std::vector<uint8_t>{0x55, 0xAA}));
    index.add(1, Signature(0, std::string("BM")));
    EXPECT_EQ(index.minSpan(), 2u);
}

TEST(SignatureIndex, EmptyPatternIsRejected) {
    SignatureIndex index;
    EXPECT_THROW(index.add(0, Signature(4, std::vector<uint8_t>{})), std::invalid_argument);
}

} // namespace
