#pragma once
#ifndef XMLCOMPARE_JSON_CODEC_HPP
#define XMLCOMPARE_JSON_CODEC_HPP

#include "batch.hpp"
#include "compare_error.hpp"
#include "diff_engine.hpp"
#include <json/json.h>
#include <string>
#include <vector>

namespace xmlcompare {

// Parsed form of { "comparisons": [...] }; exactly one list is filled
struct BatchRequest {
    bool url_form;
    std::vector<CompareRequest> inline_requests;
    std::vector<UrlCompareRequest> url_requests;

    BatchRequest() : url_form(false) {}
};

// Request decoding; malformed input is a VALIDATION error naming the field
bool parse_json_text(const std::string& text, Json::Value& root, CompareError& error);
bool compare_request_from_json(const Json::Value& value, CompareRequest& request, CompareError& error);
bool url_request_from_json(const Json::Value& value, UrlCompareRequest& request, CompareError& error);
bool batch_request_from_json(const Json::Value& value, BatchRequest& request, CompareError& error);

// Response encoding; absent optionals become null
Json::Value diff_to_json(const Diff& diff);
Json::Value result_to_json(const ComparisonResult& result);
Json::Value batch_result_to_json(const BatchResult& batch);
Json::Value error_to_json(const CompareError& error);

// Indented JSON text with trailing newline
std::string write_json(const Json::Value& value);

} // namespace xmlcompare

#endif // XMLCOMPARE_JSON_CODEC_HPP
