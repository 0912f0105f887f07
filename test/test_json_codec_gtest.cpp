// test_json_codec_gtest.cpp
// Unit tests for JSON request decoding and result encoding

#include <gtest/gtest.h>
#include "../xmlcompare/json_codec.hpp"

using namespace xmlcompare;

static Json::Value parse(const std::string& text) {
    Json::Value root;
    CompareError error;
    EXPECT_TRUE(parse_json_text(text, root, error)) << error.message;
    return root;
}

// ============================================================================
// Requests
// ============================================================================

TEST(JsonCodec, InlineBatchRequest) {
    Json::Value root = parse(R"({
        "comparisons": [
            {"xml1": "<a/>", "xml2": "<a/>"},
            {"xml1": "<b/>", "xml2": "<c/>", "ignore_paths": ["/b/*"], "ignore_properties": ["id"]}
        ]
    })");
    BatchRequest request;
    CompareError error;
    ASSERT_TRUE(batch_request_from_json(root, request, error)) << error.message;
    EXPECT_FALSE(request.url_form);
    ASSERT_EQ(request.inline_requests.size(), 2u);
    EXPECT_EQ(request.inline_requests[1].xml2, "<c/>");
    ASSERT_EQ(request.inline_requests[1].rules.paths.size(), 1u);
    EXPECT_EQ(request.inline_requests[1].rules.paths[0], "/b/*");
    EXPECT_EQ(request.inline_requests[1].rules.properties[0], "id");
}

TEST(JsonCodec, UrlBatchRequest) {
    Json::Value root = parse(R"({
        "comparisons": [
            {"url1": "http://a/x", "url2": "http://b/x",
             "auth_credentials": {"username": "u", "password": "p"}},
            {"url1": "http://a/y", "url2": "http://b/y", "session_id": "abc"}
        ]
    })");
    BatchRequest request;
    CompareError error;
    ASSERT_TRUE(batch_request_from_json(root, request, error)) << error.message;
    EXPECT_TRUE(request.url_form);
    ASSERT_EQ(request.url_requests.size(), 2u);
    EXPECT_TRUE(request.url_requests[0].has_credentials);
    EXPECT_EQ(request.url_requests[0].credentials.username, "u");
    EXPECT_EQ(request.url_requests[0].credentials.password, "p");
    EXPECT_FALSE(request.url_requests[1].has_credentials);
    // sessions live only as long as one process, so requests cannot name one
    EXPECT_TRUE(request.url_requests[1].session_id.empty());
}

TEST(JsonCodec, MissingFieldNamesItem) {
    Json::Value root = parse(R"({"comparisons": [{"xml1": "<a/>", "xml2": "<a/>"}, {"xml1": "<a/>"}]})");
    BatchRequest request;
    CompareError error;
    EXPECT_FALSE(batch_request_from_json(root, request, error));
    EXPECT_EQ(error.kind, CompareErrorKind::VALIDATION);
    EXPECT_EQ(error.message, "comparisons[1]: missing field 'xml2'");
}

TEST(JsonCodec, WrongTypes) {
    CompareRequest request;
    CompareError error;
    EXPECT_FALSE(compare_request_from_json(parse(R"({"xml1": 1, "xml2": "<a/>"})"), request, error));
    EXPECT_EQ(error.message, "field 'xml1' must be a string");

    error.clear();
    EXPECT_FALSE(compare_request_from_json(
        parse(R"({"xml1": "<a/>", "xml2": "<a/>", "ignore_paths": "/a"})"), request, error));
    EXPECT_EQ(error.message, "field 'ignore_paths' must be an array");

    BatchRequest batch;
    error.clear();
    EXPECT_FALSE(batch_request_from_json(parse(R"({"items": []})"), batch, error));
}

TEST(JsonCodec, InvalidJsonText) {
    Json::Value root;
    CompareError error;
    EXPECT_FALSE(parse_json_text("{\"comparisons\": [", root, error));
    EXPECT_EQ(error.kind, CompareErrorKind::VALIDATION);
}

// ============================================================================
// Results
// ============================================================================

TEST(JsonCodec, DiffNullsForAbsentValues) {
    Diff diff = make_attribute_extra("/a", "k", "v");
    Json::Value json = diff_to_json(diff);
    EXPECT_EQ(json["path"].asString(), "/a");
    EXPECT_EQ(json["diff_type"].asString(), "AttributeDifferent");
    EXPECT_TRUE(json["expected"].isNull());
    EXPECT_EQ(json["actual"].asString(), "k=v");
    EXPECT_EQ(json["message"].asString(), "Extra attribute 'k' in second XML");
}

TEST(JsonCodec, ResultShape) {
    ComparisonResult result;
    result.matched = false;
    result.match_ratio = 0.5;
    result.total_elements = 2;
    result.matched_elements = 1;
    result.diffs.push_back(make_content_different("/r", optional_string_some("a"),
                                                  optional_string_none()));
    Json::Value json = result_to_json(result);
    EXPECT_FALSE(json["matched"].asBool());
    EXPECT_DOUBLE_EQ(json["match_ratio"].asDouble(), 0.5);
    EXPECT_EQ(json["total_elements"].asUInt64(), 2u);
    EXPECT_EQ(json["matched_elements"].asUInt64(), 1u);
    ASSERT_EQ(json["diffs"].size(), 1u);
    EXPECT_EQ(json["diffs"][0]["diff_type"].asString(), "ContentDifferent");
    EXPECT_TRUE(json["diffs"][0]["actual"].isNull());
}

TEST(JsonCodec, BatchResultShape) {
    BatchResult batch;
    batch.results.push_back(placeholder_result());
    batch.total = 1;
    batch.failed = 1;
    Json::Value json = batch_result_to_json(batch);
    EXPECT_EQ(json["total"].asUInt64(), 1u);
    EXPECT_EQ(json["successful"].asUInt64(), 0u);
    EXPECT_EQ(json["failed"].asUInt64(), 1u);
    ASSERT_EQ(json["results"].size(), 1u);
    EXPECT_TRUE(json["results"][0]["diffs"].isArray());
    EXPECT_EQ(json["results"][0]["diffs"].size(), 0u);
}

TEST(JsonCodec, WrittenTextParsesBack) {
    ComparisonResult result;
    result.matched = true;
    result.match_ratio = 1.0;
    std::string text = write_json(result_to_json(result));
    EXPECT_EQ(text.back(), '\n');
    Json::Value root = parse(text);
    EXPECT_TRUE(root["matched"].asBool());
}

TEST(JsonCodec, ErrorObject) {
    Json::Value json = error_to_json(CompareError(CompareErrorKind::PARSE, "line 1, column 2: bad"));
    EXPECT_EQ(json["error"].asString(), "ParseError");
    EXPECT_EQ(json["message"].asString(), "XML parsing error: line 1, column 2: bad");
}
