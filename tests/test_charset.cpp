// ═══════════════════════════════════════════════════════════════════
//  test_charset.cpp — Tests for form text decoding
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <formpp/charset.h>
#include <formpp/error.h>

using namespace formpp;
using namespace formpp::charset;

TEST(CharsetTest, PolicyNames) {
    EXPECT_EQ(parseDecodeErrors("strict"), DecodeErrors::Strict);
    EXPECT_EQ(parseDecodeErrors("ignore"), DecodeErrors::Ignore);
    EXPECT_EQ(parseDecodeErrors("replace"), DecodeErrors::Replace);
    EXPECT_THROW(parseDecodeErrors("lenient"), std::invalid_argument);
    EXPECT_STREQ(toString(DecodeErrors::Replace), "replace");
}

TEST(CharsetTest, NormalizeName) {
    EXPECT_EQ(normalizeName("UTF-8"), "utf8");
    EXPECT_EQ(normalizeName("iso_8859-1"), "iso88591");
    EXPECT_TRUE(isUtf8("utf-8"));
    EXPECT_TRUE(isUtf8("UTF8"));
    EXPECT_TRUE(isUtf8("utf-8-sig"));
    EXPECT_FALSE(isUtf8("latin1"));
}

// ═══════════════════════════════════════════
//  UTF-8
// ═══════════════════════════════════════════

TEST(CharsetTest, ValidUtf8PassesThrough) {
    std::string text = "plain, caf\xc3\xa9, \xe2\x82\xac, \xf0\x9f\x98\x80";
    EXPECT_EQ(decode(text, "utf-8", DecodeErrors::Strict), text);
}

TEST(CharsetTest, EmptyInput) {
    EXPECT_EQ(decode("", "utf-8", DecodeErrors::Strict), "");
    EXPECT_EQ(decode("", "latin1", DecodeErrors::Strict), "");
}

TEST(CharsetTest, StrictRejectsInvalidByte) {
    try {
        decode("ab\xff" "cd", "utf-8", DecodeErrors::Strict);
        FAIL() << "expected an encoding error";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Encoding);
        EXPECT_EQ(e.statusCode(), 400);
        EXPECT_EQ(e.details().at("offset"), 2);
        EXPECT_NE(std::string(e.what()).find("0xff"), std::string::npos);
    }
}

TEST(CharsetTest, StrictRejectsTruncatedSequence) {
    EXPECT_THROW(decode("caf\xc3", "utf-8", DecodeErrors::Strict), HttpError);
}

TEST(CharsetTest, IgnoreDropsInvalidBytes) {
    EXPECT_EQ(decode("a\xff" "b\xfe" "c", "utf-8", DecodeErrors::Ignore), "abc");
}

TEST(CharsetTest, ReplaceSubstitutesReplacementCharacter) {
    EXPECT_EQ(decode("a\xff" "b", "utf-8", DecodeErrors::Replace), "a\xef\xbf\xbd" "b");
}

TEST(CharsetTest, ReplaceUsesOneCharacterPerTruncatedSequence) {
    EXPECT_EQ(decode("a\xe2\x82z", "utf-8", DecodeErrors::Replace), "a\xef\xbf\xbdz");
    EXPECT_EQ(decode("a\xf0\x9f\x98", "utf-8", DecodeErrors::Replace), "a\xef\xbf\xbd");
    // Bytes that can never start a sequence are replaced one by one.
    EXPECT_EQ(decode("\xc0\xaf", "utf-8", DecodeErrors::Replace),
              "\xef\xbf\xbd\xef\xbf\xbd");
    // A surrogate lead stops at its first out-of-range byte.
    EXPECT_EQ(decode("\xed\xa0\x80", "utf-8", DecodeErrors::Replace),
              "\xef\xbf\xbd\xef\xbf\xbd\xef\xbf\xbd");
    EXPECT_EQ(decode("a\xe2\x82z", "utf-8", DecodeErrors::Ignore), "az");
}

// ═══════════════════════════════════════════
//  Other charsets
// ═══════════════════════════════════════════

TEST(CharsetTest, Latin1ToUtf8) {
    EXPECT_EQ(decode("caf\xe9", "iso-8859-1", DecodeErrors::Strict), "caf\xc3\xa9");
    EXPECT_EQ(decode("\xa3" "5", "latin1", DecodeErrors::Strict), "\xc2\xa3" "5");
}

TEST(CharsetTest, UnknownCharsetIsConfigurationError) {
    try {
        decode("abc", "x-no-such-charset", DecodeErrors::Strict);
        FAIL() << "expected a configuration error";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Configuration);
        EXPECT_EQ(e.details().at("charset"), "x-no-such-charset");
    }
}
