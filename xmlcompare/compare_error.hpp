#pragma once
#ifndef XMLCOMPARE_COMPARE_ERROR_HPP
#define XMLCOMPARE_COMPARE_ERROR_HPP

#include <string>

namespace xmlcompare {

// Failure categories surfaced by a single comparison call
enum class CompareErrorKind {
    NONE,
    PARSE,          // malformed XML handed to the flattener
    VALIDATION,     // empty or non-XML-looking text, caught before parsing
    INVALID_URL,    // URL without http:// or https:// scheme
    FETCH,          // document source could not retrieve a document
    AUTH,           // login rejected or session unknown/expired
    CANCELLED,      // batch cancelled before the item finished
    INTERNAL
};

struct CompareError {
    CompareErrorKind kind;
    std::string message;

    CompareError() : kind(CompareErrorKind::NONE) {}
    CompareError(CompareErrorKind k, const std::string& msg) : kind(k), message(msg) {}

    bool isSet() const { return kind != CompareErrorKind::NONE; }
    void set(CompareErrorKind k, const std::string& msg) { kind = k; message = msg; }
    void clear() { kind = CompareErrorKind::NONE; message.clear(); }
};

const char* error_kind_name(CompareErrorKind kind);

// "XML parsing error: ..." style rendering for logs and CLI output
std::string to_string(const CompareError& error);

} // namespace xmlcompare

#endif // XMLCOMPARE_COMPARE_ERROR_HPP
