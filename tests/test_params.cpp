// ═══════════════════════════════════════════════════════════════════
//  test_params.cpp — Tests for header parameters and boundary lookup
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <formpp/error.h>
#include <formpp/params.h>

using namespace formpp;

// ═══════════════════════════════════════════
//  parseHeaderValue
// ═══════════════════════════════════════════

TEST(HeaderValueTest, ValueAndParams) {
    auto hv = parseHeaderValue("form-data; name=\"avatar\"; filename=\"me.png\"");
    EXPECT_EQ(hv.value, "form-data");
    EXPECT_EQ(hv.param("name"), "avatar");
    EXPECT_EQ(hv.param("filename"), "me.png");
    EXPECT_FALSE(hv.param("size").has_value());
}

TEST(HeaderValueTest, ParamNamesAreCaseInsensitive) {
    auto hv = parseHeaderValue("form-data; NAME=\"x\"");
    EXPECT_EQ(hv.param("name"), "x");
    EXPECT_EQ(hv.param("Name"), "x");
}

TEST(HeaderValueTest, UnquotedValues) {
    auto hv = parseHeaderValue("multipart/form-data;boundary=abc123 ; charset = utf-8");
    EXPECT_EQ(hv.param("boundary"), "abc123");
    EXPECT_EQ(hv.param("charset"), "utf-8");
}

TEST(HeaderValueTest, SemicolonInsideQuotes) {
    auto hv = parseHeaderValue("form-data; name=\"a;b\"; filename=\"c.txt\"");
    EXPECT_EQ(hv.param("name"), "a;b");
    EXPECT_EQ(hv.param("filename"), "c.txt");
}

TEST(HeaderValueTest, EscapedQuotesAndBackslashes) {
    auto hv = parseHeaderValue(R"(form-data; name="say \"hi\""; filename="a\\b.txt")");
    EXPECT_EQ(hv.param("name"), "say \"hi\"");
    EXPECT_EQ(hv.param("filename"), "a\\b.txt");
}

TEST(HeaderValueTest, WindowsPathKeepsBackslashes) {
    auto hv = parseHeaderValue(R"(form-data; name="f"; filename="C:\Users\me\photo.jpg")");
    EXPECT_EQ(hv.param("filename"), R"(C:\Users\me\photo.jpg)");
}

TEST(HeaderValueTest, ExtendedValueIsPercentDecoded) {
    auto hv = parseHeaderValue("attachment; filename*=UTF-8''%E2%82%AC%20rates.txt");
    EXPECT_EQ(hv.param("filename*"), "\xe2\x82\xac rates.txt");
}

TEST(HeaderValueTest, ExtendedValueInLatin1) {
    auto hv = parseHeaderValue("attachment; filename*=iso-8859-1'en'caf%E9.txt");
    EXPECT_EQ(hv.param("filename*"), "caf\xc3\xa9.txt");
}

TEST(HeaderValueTest, SegmentsWithoutEqualsAreIgnored) {
    auto hv = parseHeaderValue("form-data; junk; name=\"x\"");
    ASSERT_EQ(hv.params.size(), 1u);
    EXPECT_EQ(hv.params[0].first, "name");
}

// ═══════════════════════════════════════════
//  mediaType
// ═══════════════════════════════════════════

TEST(MediaTypeTest, LowercasesAndStripsParams) {
    EXPECT_EQ(mediaType("Multipart/Form-Data; boundary=x"), "multipart/form-data");
    EXPECT_EQ(mediaType("  text/plain  "), "text/plain");
}

TEST(MediaTypeTest, MalformedIsEmpty) {
    EXPECT_EQ(mediaType(""), "");
    EXPECT_EQ(mediaType("textplain"), "");
    EXPECT_EQ(mediaType("/plain"), "");
    EXPECT_EQ(mediaType("text/"), "");
}

// ═══════════════════════════════════════════
//  resolveBoundary
// ═══════════════════════════════════════════

TEST(ResolveBoundaryTest, PlainBoundary) {
    auto info = resolveBoundary("multipart/form-data; boundary=----WebKitFormBoundary7MA4YWxk");
    EXPECT_EQ(info.boundary, "----WebKitFormBoundary7MA4YWxk");
    EXPECT_FALSE(info.charset.has_value());
}

TEST(ResolveBoundaryTest, QuotedBoundaryWithCharset) {
    auto info = resolveBoundary("multipart/form-data; charset=latin1; boundary=\"a b:c\"");
    EXPECT_EQ(info.boundary, "a b:c");
    EXPECT_EQ(info.charset, "latin1");
}

TEST(ResolveBoundaryTest, MissingBoundaryIsConfigurationError) {
    try {
        resolveBoundary("multipart/form-data");
        FAIL() << "expected a configuration error";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Configuration);
        EXPECT_EQ(e.statusCode(), 400);
        EXPECT_STREQ(e.what(), "Missing boundary in Content-Type header");
        EXPECT_EQ(e.details().at("content_type"), "multipart/form-data");
    }
}

TEST(ResolveBoundaryTest, EmptyBoundaryIsConfigurationError) {
    EXPECT_THROW(resolveBoundary("multipart/form-data; boundary=\"\""), HttpError);
    EXPECT_THROW(resolveBoundary("multipart/form-data; boundary="), HttpError);
}
