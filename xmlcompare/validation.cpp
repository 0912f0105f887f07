#include "validation.hpp"
#include <string.h>

namespace xmlcompare {

static bool is_xml_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool validate_xml_content(const std::string& text, CompareError& error) {
    size_t start = 0;
    while (start < text.size() && is_xml_space(text[start])) start++;

    if (start == text.size()) {
        error.set(CompareErrorKind::VALIDATION, "XML content cannot be empty");
        return false;
    }
    if (text[start] != '<') {
        error.set(CompareErrorKind::VALIDATION, "Invalid XML format");
        return false;
    }
    return true;
}

bool validate_url(const std::string& url, CompareError& error) {
    if (strncmp(url.c_str(), "http://", 7) == 0 || strncmp(url.c_str(), "https://", 8) == 0) {
        return true;
    }
    error.set(CompareErrorKind::INVALID_URL, url);
    return false;
}

} // namespace xmlcompare
