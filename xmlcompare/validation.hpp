#pragma once
#ifndef XMLCOMPARE_VALIDATION_HPP
#define XMLCOMPARE_VALIDATION_HPP

#include "compare_error.hpp"
#include <string>

namespace xmlcompare {

// Cheap sanity check run before parsing: non-blank and starting with '<'
bool validate_xml_content(const std::string& text, CompareError& error);

// Only http:// and https:// URLs are accepted
bool validate_url(const std::string& url, CompareError& error);

} // namespace xmlcompare

#endif // XMLCOMPARE_VALIDATION_HPP
