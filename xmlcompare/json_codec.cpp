#include "json_codec.hpp"
#include <memory>
#include <sstream>

namespace xmlcompare {

bool parse_json_text(const std::string& text, Json::Value& root, CompareError& error) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
        error.set(CompareErrorKind::VALIDATION, "invalid JSON: " + errs);
        return false;
    }
    return true;
}

static bool read_string(const Json::Value& obj, const char* key, bool required, std::string& out,
                        CompareError& error) {
    const Json::Value& v = obj[key];
    if (v.isNull()) {
        if (!required) return true;
        error.set(CompareErrorKind::VALIDATION, std::string("missing field '") + key + "'");
        return false;
    }
    if (!v.isString()) {
        error.set(CompareErrorKind::VALIDATION, std::string("field '") + key + "' must be a string");
        return false;
    }
    out = v.asString();
    return true;
}

static bool read_string_list(const Json::Value& obj, const char* key, std::vector<std::string>& out,
                             CompareError& error) {
    const Json::Value& v = obj[key];
    if (v.isNull()) return true;
    if (!v.isArray()) {
        error.set(CompareErrorKind::VALIDATION, std::string("field '") + key + "' must be an array");
        return false;
    }
    for (Json::ArrayIndex i = 0; i < v.size(); i++) {
        if (!v[i].isString()) {
            error.set(CompareErrorKind::VALIDATION,
                      std::string("field '") + key + "' must contain only strings");
            return false;
        }
        out.push_back(v[i].asString());
    }
    return true;
}

static bool read_rules(const Json::Value& value, IgnoreRules& rules, CompareError& error) {
    return read_string_list(value, "ignore_paths", rules.paths, error) &&
           read_string_list(value, "ignore_properties", rules.properties, error);
}

bool compare_request_from_json(const Json::Value& value, CompareRequest& request, CompareError& error) {
    if (!value.isObject()) {
        error.set(CompareErrorKind::VALIDATION, "comparison must be an object");
        return false;
    }
    return read_string(value, "xml1", true, request.xml1, error) &&
           read_string(value, "xml2", true, request.xml2, error) &&
           read_rules(value, request.rules, error);
}

bool url_request_from_json(const Json::Value& value, UrlCompareRequest& request, CompareError& error) {
    if (!value.isObject()) {
        error.set(CompareErrorKind::VALIDATION, "comparison must be an object");
        return false;
    }
    if (!read_string(value, "url1", true, request.url1, error) ||
        !read_string(value, "url2", true, request.url2, error) ||
        !read_rules(value, request.rules, error)) {
        return false;
    }

    const Json::Value& creds = value["auth_credentials"];
    if (!creds.isNull()) {
        if (!creds.isObject()) {
            error.set(CompareErrorKind::VALIDATION, "field 'auth_credentials' must be an object");
            return false;
        }
        if (!read_string(creds, "username", true, request.credentials.username, error) ||
            !read_string(creds, "password", true, request.credentials.password, error)) {
            return false;
        }
        request.has_credentials = true;
    }
    return true;
}

bool batch_request_from_json(const Json::Value& value, BatchRequest& request, CompareError& error) {
    if (!value.isObject() || !value["comparisons"].isArray()) {
        error.set(CompareErrorKind::VALIDATION, "missing array field 'comparisons'");
        return false;
    }
    const Json::Value& items = value["comparisons"];
    request.url_form = items.size() > 0 && items[0].isObject() && items[0].isMember("url1");

    for (Json::ArrayIndex i = 0; i < items.size(); i++) {
        bool ok;
        if (request.url_form) {
            UrlCompareRequest item;
            ok = url_request_from_json(items[i], item, error);
            if (ok) request.url_requests.push_back(item);
        } else {
            CompareRequest item;
            ok = compare_request_from_json(items[i], item, error);
            if (ok) request.inline_requests.push_back(item);
        }
        if (!ok) {
            std::ostringstream msg;
            msg << "comparisons[" << i << "]: " << error.message;
            error.message = msg.str();
            return false;
        }
    }
    return true;
}

static Json::Value optional_to_json(const OptionalString& value) {
    return value.has_value ? Json::Value(value.value) : Json::Value(Json::nullValue);
}

Json::Value diff_to_json(const Diff& diff) {
    Json::Value out(Json::objectValue);
    out["path"] = diff.path;
    out["diff_type"] = diff_kind_name(diff.kind);
    out["expected"] = optional_to_json(diff.expected);
    out["actual"] = optional_to_json(diff.actual);
    out["message"] = diff.message;
    return out;
}

Json::Value result_to_json(const ComparisonResult& result) {
    Json::Value out(Json::objectValue);
    out["matched"] = result.matched;
    out["match_ratio"] = result.match_ratio;
    Json::Value diffs(Json::arrayValue);
    for (const Diff& diff : result.diffs) {
        diffs.append(diff_to_json(diff));
    }
    out["diffs"] = diffs;
    out["total_elements"] = (Json::UInt64)result.total_elements;
    out["matched_elements"] = (Json::UInt64)result.matched_elements;
    return out;
}

Json::Value batch_result_to_json(const BatchResult& batch) {
    Json::Value out(Json::objectValue);
    Json::Value results(Json::arrayValue);
    for (const ComparisonResult& result : batch.results) {
        results.append(result_to_json(result));
    }
    out["results"] = results;
    out["total"] = (Json::UInt64)batch.total;
    out["successful"] = (Json::UInt64)batch.successful;
    out["failed"] = (Json::UInt64)batch.failed;
    return out;
}

Json::Value error_to_json(const CompareError& error) {
    Json::Value out(Json::objectValue);
    out["error"] = error_kind_name(error.kind);
    out["message"] = to_string(error);
    return out;
}

std::string write_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value) + "\n";
}

} // namespace xmlcompare
