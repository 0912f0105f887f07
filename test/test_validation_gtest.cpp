// test_validation_gtest.cpp
// Unit tests for input validation and error rendering

#include <gtest/gtest.h>
#include "../xmlcompare/validation.hpp"

using namespace xmlcompare;

TEST(Validation, AcceptsXmlLookingText) {
    CompareError error;
    EXPECT_TRUE(validate_xml_content("<a/>", error));
    EXPECT_TRUE(validate_xml_content("  \n\t<?xml version=\"1.0\"?><a/>", error));
    EXPECT_FALSE(error.isSet());
}

TEST(Validation, RejectsBlankContent) {
    CompareError error;
    EXPECT_FALSE(validate_xml_content("", error));
    EXPECT_EQ(error.kind, CompareErrorKind::VALIDATION);
    EXPECT_EQ(error.message, "XML content cannot be empty");

    error.clear();
    EXPECT_FALSE(validate_xml_content(" \r\n ", error));
    EXPECT_EQ(error.message, "XML content cannot be empty");
}

TEST(Validation, RejectsNonXml) {
    CompareError error;
    EXPECT_FALSE(validate_xml_content("{\"json\": true}", error));
    EXPECT_EQ(error.kind, CompareErrorKind::VALIDATION);
    EXPECT_EQ(error.message, "Invalid XML format");
    EXPECT_EQ(to_string(error), "Validation error: Invalid XML format");
}

TEST(Validation, UrlScheme) {
    CompareError error;
    EXPECT_TRUE(validate_url("http://example.com/a.xml", error));
    EXPECT_TRUE(validate_url("https://example.com", error));
    EXPECT_FALSE(validate_url("ftp://example.com/a.xml", error));
    EXPECT_EQ(error.kind, CompareErrorKind::INVALID_URL);
    EXPECT_EQ(to_string(error), "Invalid URL: ftp://example.com/a.xml");

    error.clear();
    EXPECT_FALSE(validate_url("example.com", error));
    EXPECT_FALSE(validate_url("", error));
}

TEST(CompareError, KindNames) {
    EXPECT_STREQ(error_kind_name(CompareErrorKind::PARSE), "ParseError");
    EXPECT_STREQ(error_kind_name(CompareErrorKind::AUTH), "AuthError");
    EXPECT_STREQ(error_kind_name(CompareErrorKind::FETCH), "FetchError");
    EXPECT_EQ(to_string(CompareError(CompareErrorKind::AUTH, "HTTP 401")),
              "Authentication failed: HTTP 401");
}
