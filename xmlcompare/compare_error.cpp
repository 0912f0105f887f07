#include "compare_error.hpp"

namespace xmlcompare {

const char* error_kind_name(CompareErrorKind kind) {
    switch (kind) {
    case CompareErrorKind::NONE:        return "None";
    case CompareErrorKind::PARSE:       return "ParseError";
    case CompareErrorKind::VALIDATION:  return "ValidationError";
    case CompareErrorKind::INVALID_URL: return "InvalidUrl";
    case CompareErrorKind::FETCH:       return "FetchError";
    case CompareErrorKind::AUTH:        return "AuthError";
    case CompareErrorKind::CANCELLED:   return "Cancelled";
    case CompareErrorKind::INTERNAL:    return "InternalError";
    }
    return "Unknown";
}

std::string to_string(const CompareError& error) {
    switch (error.kind) {
    case CompareErrorKind::NONE:        return "no error";
    case CompareErrorKind::PARSE:       return "XML parsing error: " + error.message;
    case CompareErrorKind::VALIDATION:  return "Validation error: " + error.message;
    case CompareErrorKind::INVALID_URL: return "Invalid URL: " + error.message;
    case CompareErrorKind::FETCH:       return "HTTP request error: " + error.message;
    case CompareErrorKind::AUTH:        return "Authentication failed: " + error.message;
    case CompareErrorKind::CANCELLED:   return "Cancelled: " + error.message;
    case CompareErrorKind::INTERNAL:    return "Internal error: " + error.message;
    }
    return error.message;
}

} // namespace xmlcompare
