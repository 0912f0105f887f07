// test_document_source_gtest.cpp
// Unit tests for the libcurl document source (local failure cases only)

#include <gtest/gtest.h>
#include "../xmlcompare/document_source.hpp"

using namespace xmlcompare;

// ============================================================================
// Cookie handling
// ============================================================================

TEST(CookieHeaders, ParseSetCookie) {
    EXPECT_EQ(parse_set_cookie("Set-Cookie: sid=abc123; Path=/; HttpOnly\r\n"), "sid=abc123");
    EXPECT_EQ(parse_set_cookie("set-cookie:lang=en\r\n"), "lang=en");
    EXPECT_EQ(parse_set_cookie("Set-Cookie: token=a=b==; Secure"), "token=a=b==");
}

TEST(CookieHeaders, IgnoresOtherHeaders) {
    EXPECT_EQ(parse_set_cookie("Content-Type: text/xml\r\n"), "");
    EXPECT_EQ(parse_set_cookie("HTTP/1.1 200 OK\r\n"), "");
    EXPECT_EQ(parse_set_cookie("Set-Cookie: novalue\r\n"), "");
    EXPECT_EQ(parse_set_cookie("Set-Cookie:"), "");
}

TEST(CookieHeaders, CookieHeaderValue) {
    EXPECT_EQ(cookie_header_value({}), "");
    EXPECT_EQ(cookie_header_value({"sid=1"}), "sid=1");
    EXPECT_EQ(cookie_header_value({"sid=1", "lang=en"}), "sid=1; lang=en");
}

// ============================================================================
// Transfers
// ============================================================================

class CurlDocumentSourceTest : public ::testing::Test {
protected:
    HttpConfig config;

    void SetUp() override {
        config.timeout_ms = 2000;
        config.connect_timeout_ms = 1000;
    }
};

TEST_F(CurlDocumentSourceTest, DefaultConfig) {
    HttpConfig defaults;
    EXPECT_EQ(defaults.timeout_ms, 30000);
    EXPECT_EQ(defaults.connect_timeout_ms, 5000);
    EXPECT_EQ(defaults.max_redirects, 5);
    EXPECT_EQ(defaults.user_agent, "xmlcompare/1.0");
    EXPECT_TRUE(defaults.verify_tls);
}

TEST_F(CurlDocumentSourceTest, FetchFromClosedPortIsFetchError) {
    CurlDocumentSource source(config);
    std::string body;
    CompareError error;
    EXPECT_FALSE(source.fetch("http://127.0.0.1:1/doc.xml", nullptr, body, nullptr, error));
    EXPECT_EQ(error.kind, CompareErrorKind::FETCH);
    EXPECT_NE(error.message.find("127.0.0.1:1"), std::string::npos);
    EXPECT_TRUE(body.empty());
}

TEST_F(CurlDocumentSourceTest, LoginAgainstClosedPortIsAuthError) {
    CurlDocumentSource source(config);
    AuthToken token;
    CompareError error;
    EXPECT_FALSE(source.authenticate("http://127.0.0.1:1/login", "user", "p&ss word", token,
                                     nullptr, error));
    EXPECT_EQ(error.kind, CompareErrorKind::AUTH);
    EXPECT_TRUE(token.cookies.empty());
}
