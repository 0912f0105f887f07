#pragma once
#ifndef XMLCOMPARE_DIFF_ENGINE_HPP
#define XMLCOMPARE_DIFF_ENGINE_HPP

#include "path_matcher.hpp"
#include "xml_element.hpp"
#include <string>
#include <vector>

namespace xmlcompare {

enum class DiffKind {
    ELEMENT_MISSING,        // present in the first document only
    ELEMENT_EXTRA,          // present in the second document only
    ATTRIBUTE_DIFFERENT,
    CONTENT_DIFFERENT,
    STRUCTURE_DIFFERENT     // aligned records differ in a field no other kind covers
};

// "ElementMissing", "ElementExtra", ...
const char* diff_kind_name(DiffKind kind);

/**
 * One reported difference.
 *
 * Payload by kind:
 *   ELEMENT_MISSING      expected = debug rendering of the first element
 *   ELEMENT_EXTRA        actual   = debug rendering of the second element
 *   ATTRIBUTE_DIFFERENT  key=value on each side where the attribute exists
 *   CONTENT_DIFFERENT    the two text contents, either may be absent
 *   STRUCTURE_DIFFERENT  debug renderings of both elements
 * Build diffs with the make_* functions below so the payload matches the kind.
 */
struct Diff {
    std::string path;
    DiffKind kind;
    OptionalString expected;
    OptionalString actual;
    std::string message;
};

Diff make_element_missing(const std::string& path, const XmlElement& expected);
Diff make_element_extra(const std::string& path, const XmlElement& actual);
Diff make_attribute_changed(const std::string& path, const std::string& key,
                            const std::string& expected, const std::string& actual);
Diff make_attribute_missing(const std::string& path, const std::string& key,
                            const std::string& expected);
Diff make_attribute_extra(const std::string& path, const std::string& key,
                          const std::string& actual);
Diff make_content_different(const std::string& path, const OptionalString& expected,
                            const OptionalString& actual);
Diff make_structure_different(const std::string& path, const XmlElement& expected,
                              const XmlElement& actual);

struct ComparisonResult {
    bool matched;
    double match_ratio;
    std::vector<Diff> diffs;
    size_t total_elements;
    size_t matched_elements;

    ComparisonResult() : matched(false), match_ratio(0.0), total_elements(0), matched_elements(0) {}
};

// Zero-value result standing in for a comparison that could not run
inline ComparisonResult placeholder_result() {
    return ComparisonResult();
}

/**
 * Compare two flattened documents.
 *
 * Records are aligned by (structural path, ordinal). Every applicable
 * difference of an element is reported, extra attributes included.
 * match_ratio = matched_elements / max(|doc1|, |doc2|), or 1.0 when both are
 * empty.
 */
ComparisonResult compare(const FlatDocument& doc1, const FlatDocument& doc2,
                         const IgnoreRules& rules);

} // namespace xmlcompare

#endif // XMLCOMPARE_DIFF_ENGINE_HPP
