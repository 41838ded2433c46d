// ═══════════════════════════════════════════════════════════════════
//  test_error.cpp — Tests for HttpError
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <formpp/error.h>

using namespace formpp;

TEST(HttpErrorTest, FactoriesSetKindAndStatus) {
    EXPECT_EQ(HttpError::configuration("x").statusCode(), 400);
    EXPECT_EQ(HttpError::protocol("x").statusCode(), 400);
    EXPECT_EQ(HttpError::encoding("x").statusCode(), 400);
    EXPECT_EQ(HttpError::sizeLimit("x").statusCode(), 413);
    EXPECT_EQ(HttpError::storage("x").statusCode(), 500);

    EXPECT_EQ(HttpError::configuration("x").kind(), ErrorKind::Configuration);
    EXPECT_EQ(HttpError::sizeLimit("x").kind(), ErrorKind::SizeLimit);
    EXPECT_EQ(HttpError::storage("x").kind(), ErrorKind::Storage);
}

TEST(HttpErrorTest, MessageAndWhat) {
    auto e = HttpError::protocol("Missing Content-Disposition header.");
    EXPECT_STREQ(e.what(), "Missing Content-Disposition header.");
    EXPECT_EQ(e.message(), "Missing Content-Disposition header.");
}

TEST(HttpErrorTest, IsARuntimeError) {
    try {
        throw HttpError::storage("disk full");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "disk full");
    }
}

TEST(HttpErrorTest, KindNames) {
    EXPECT_STREQ(toString(ErrorKind::Configuration), "configuration");
    EXPECT_STREQ(toString(ErrorKind::SizeLimit), "size_limit");
    EXPECT_STREQ(toString(ErrorKind::Protocol), "protocol");
    EXPECT_STREQ(toString(ErrorKind::Encoding), "encoding");
    EXPECT_STREQ(toString(ErrorKind::Storage), "storage");
}

TEST(HttpErrorTest, ToJsonUsesReasonPhrase) {
    auto j = HttpError::protocol("bad part").toJson();
    EXPECT_EQ(j["error"], "Bad Request");
    EXPECT_EQ(j["message"], "bad part");
    EXPECT_EQ(j["status"], 400);
    EXPECT_EQ(j["kind"], "protocol");
    EXPECT_FALSE(j.contains("details"));

    EXPECT_EQ(HttpError::sizeLimit("big").toJson()["error"], "Payload Too Large");
    EXPECT_EQ(HttpError::storage("io").toJson()["error"], "Internal Server Error");
}

TEST(HttpErrorTest, ToJsonIncludesDetails) {
    auto e = HttpError::sizeLimit("too big", {{"max_body_size", 1024}});
    auto j = e.toJson();
    ASSERT_TRUE(j.contains("details"));
    EXPECT_EQ(j["details"]["max_body_size"], 1024);
    EXPECT_EQ(e.details().at("max_body_size"), 1024);
}
