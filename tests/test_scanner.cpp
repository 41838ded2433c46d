// ═══════════════════════════════════════════════════════════════════
//  test_scanner.cpp — Tests for the bounded read-and-search buffer
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <formpp/scanner.h>
#include <formpp/testing.h>

using namespace formpp;
using namespace formpp::multipart;
using formpp::testing::ChunkedStream;
using formpp::testing::CountingStream;

TEST(ChunkedScannerTest, FillReadsOneChunk) {
    StringStream stream("abcdefghij");
    ChunkedScanner scanner(stream, 10, 100, 4);

    EXPECT_TRUE(scanner.fill());
    EXPECT_EQ(scanner.view(), "abcd");
    EXPECT_EQ(scanner.remaining(), 6u);
    EXPECT_EQ(scanner.totalRead(), 4u);
}

TEST(ChunkedScannerTest, FillStopsAtDeclaredLength) {
    CountingStream stream("abcdefghij-trailing");
    ChunkedScanner scanner(stream, 10, 100, 4);

    while (scanner.fill()) {}
    EXPECT_EQ(scanner.view(), "abcdefghij");
    EXPECT_TRUE(scanner.exhausted());
    EXPECT_EQ(stream.bytesDelivered(), 10u);
    EXPECT_LE(stream.largestRequest(), 4u);
    EXPECT_FALSE(scanner.fill());
}

TEST(ChunkedScannerTest, ShortStreamMarksDry) {
    StringStream stream("abc");
    ChunkedScanner scanner(stream, 10, 100, 8);

    EXPECT_TRUE(scanner.fill());
    EXPECT_FALSE(scanner.fill());
    EXPECT_TRUE(scanner.exhausted());
    EXPECT_EQ(scanner.remaining(), 7u);
}

TEST(ChunkedScannerTest, EnsureAccumulatesShortReads) {
    ChunkedStream stream("0123456789", 1);
    ChunkedScanner scanner(stream, 10, 100, 4);

    EXPECT_TRUE(scanner.ensure(6));
    EXPECT_GE(scanner.size(), 6u);
    EXPECT_GE(stream.calls(), 6u);
    EXPECT_FALSE(scanner.ensure(20));
    EXPECT_EQ(scanner.view(), "0123456789");
}

TEST(ChunkedScannerTest, FindAndStartsWith) {
    StringStream stream("--B\r\nhello");
    ChunkedScanner scanner(stream, 10, 100, 16);
    scanner.fill();

    EXPECT_TRUE(scanner.startsWith("--B"));
    EXPECT_FALSE(scanner.startsWith("--C"));
    EXPECT_EQ(scanner.find("\r\n"), 3u);
    EXPECT_EQ(scanner.find("missing"), std::string_view::npos);
}

TEST(ChunkedScannerTest, ConsumeAndKeepTail) {
    StringStream stream("0123456789");
    ChunkedScanner scanner(stream, 10, 100, 16);
    scanner.fill();

    scanner.consume(2);
    EXPECT_EQ(scanner.view(), "23456789");

    scanner.keepTail(3);
    EXPECT_EQ(scanner.view(), "789");

    scanner.keepTail(10);
    EXPECT_EQ(scanner.view(), "789");

    scanner.consume(100);
    EXPECT_EQ(scanner.size(), 0u);
}

TEST(ChunkedScannerTest, ReadingPastMaxBodySizeThrows) {
    StringStream stream(std::string(20, 'x'));
    ChunkedScanner scanner(stream, 20, 10, 8);

    EXPECT_TRUE(scanner.fill());
    try {
        scanner.fill();
        FAIL() << "expected a size limit error";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SizeLimit);
        EXPECT_EQ(e.statusCode(), 413);
        EXPECT_STREQ(e.what(), "Request entity too large");
    }
}

TEST(ChunkedScannerTest, PeakTracksLargestBuffer) {
    StringStream stream(std::string(32, 'x'));
    ChunkedScanner scanner(stream, 32, 100, 8);

    scanner.fill();
    scanner.fill();
    EXPECT_EQ(scanner.peakSize(), 16u);

    scanner.consume(16);
    scanner.fill();
    EXPECT_EQ(scanner.peakSize(), 16u);
    EXPECT_EQ(scanner.size(), 8u);
}

TEST(ChunkedScannerTest, ResetDropsBuffer) {
    StringStream stream("abcdef");
    ChunkedScanner scanner(stream, 6, 100, 16);
    scanner.fill();
    scanner.reset();

    EXPECT_EQ(scanner.size(), 0u);
    EXPECT_EQ(scanner.totalRead(), 6u);
}
