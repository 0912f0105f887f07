#include "diff_engine.hpp"
#include "../lib/log.h"
#include <algorithm>

namespace xmlcompare {

static log_category_t* diff_log() { return log_get_category("diff"); }

const char* diff_kind_name(DiffKind kind) {
    switch (kind) {
    case DiffKind::ELEMENT_MISSING:     return "ElementMissing";
    case DiffKind::ELEMENT_EXTRA:       return "ElementExtra";
    case DiffKind::ATTRIBUTE_DIFFERENT: return "AttributeDifferent";
    case DiffKind::CONTENT_DIFFERENT:   return "ContentDifferent";
    case DiffKind::STRUCTURE_DIFFERENT: return "StructureDifferent";
    }
    return "Unknown";
}

// ============================================================================
// Diff construction
// ============================================================================

static Diff make_diff(const std::string& path, DiffKind kind, const OptionalString& expected,
                      const OptionalString& actual, const std::string& message) {
    Diff diff;
    diff.path = path;
    diff.kind = kind;
    diff.expected = expected;
    diff.actual = actual;
    diff.message = message;
    return diff;
}

Diff make_element_missing(const std::string& path, const XmlElement& expected) {
    return make_diff(path, DiffKind::ELEMENT_MISSING,
                     optional_string_some(element_debug_string(expected)),
                     optional_string_none(), "Element missing in second XML");
}

Diff make_element_extra(const std::string& path, const XmlElement& actual) {
    return make_diff(path, DiffKind::ELEMENT_EXTRA, optional_string_none(),
                     optional_string_some(element_debug_string(actual)),
                     "Extra element in second XML");
}

Diff make_attribute_changed(const std::string& path, const std::string& key,
                            const std::string& expected, const std::string& actual) {
    return make_diff(path, DiffKind::ATTRIBUTE_DIFFERENT,
                     optional_string_some(key + "=" + expected),
                     optional_string_some(key + "=" + actual),
                     "Attribute '" + key + "' differs");
}

Diff make_attribute_missing(const std::string& path, const std::string& key,
                            const std::string& expected) {
    return make_diff(path, DiffKind::ATTRIBUTE_DIFFERENT,
                     optional_string_some(key + "=" + expected), optional_string_none(),
                     "Attribute '" + key + "' missing in second XML");
}

Diff make_attribute_extra(const std::string& path, const std::string& key,
                          const std::string& actual) {
    return make_diff(path, DiffKind::ATTRIBUTE_DIFFERENT, optional_string_none(),
                     optional_string_some(key + "=" + actual),
                     "Extra attribute '" + key + "' in second XML");
}

Diff make_content_different(const std::string& path, const OptionalString& expected,
                            const OptionalString& actual) {
    return make_diff(path, DiffKind::CONTENT_DIFFERENT, expected, actual, "Content differs");
}

Diff make_structure_different(const std::string& path, const XmlElement& expected,
                              const XmlElement& actual) {
    return make_diff(path, DiffKind::STRUCTURE_DIFFERENT,
                     optional_string_some(element_debug_string(expected)),
                     optional_string_some(element_debug_string(actual)),
                     "Elements differ");
}

// ============================================================================
// Element comparison
// ============================================================================

static bool element_is_ignored(const XmlElement& element, const IgnoreRules& rules) {
    return path_is_ignored(element.path, rules.paths) ||
           property_is_ignored(element.name, rules.properties);
}

static bool attributes_equal(const AttributeMap& a1, const AttributeMap& a2,
                             const IgnoreRules& rules) {
    for (AttributeMap::const_iterator it = a1.begin(); it != a1.end(); ++it) {
        if (property_is_ignored(it->first, rules.properties)) continue;
        AttributeMap::const_iterator other = a2.find(it->first);
        if (other == a2.end() || other->second != it->second) return false;
    }
    for (AttributeMap::const_iterator it = a2.begin(); it != a2.end(); ++it) {
        if (property_is_ignored(it->first, rules.properties)) continue;
        if (a1.find(it->first) == a1.end()) return false;
    }
    return true;
}

// Compares the non-ignored fields of two aligned records. Child order is not a field.
static bool records_equal(const XmlElement& e1, const XmlElement& e2, const IgnoreRules& rules) {
    if (e1.name != e2.name) return false;
    bool content_ignored = property_is_ignored(e1.name, rules.properties) ||
                           property_is_ignored(e2.name, rules.properties);
    if (!content_ignored && !optional_string_equal(e1.content, e2.content)) return false;
    return attributes_equal(e1.attributes, e2.attributes, rules);
}

// Appends the diffs of one aligned pair; returns how many were added
static size_t compare_pair(const XmlElement& e1, const XmlElement& e2,
                           const IgnoreRules& rules, std::vector<Diff>& diffs) {
    size_t before = diffs.size();
    std::string path = element_display_path(e1);

    if (!property_is_ignored(e1.name, rules.properties) &&
        !property_is_ignored(e2.name, rules.properties) &&
        !optional_string_equal(e1.content, e2.content)) {
        diffs.push_back(make_content_different(path, e1.content, e2.content));
    }

    for (AttributeMap::const_iterator it = e1.attributes.begin(); it != e1.attributes.end(); ++it) {
        if (property_is_ignored(it->first, rules.properties)) continue;
        AttributeMap::const_iterator other = e2.attributes.find(it->first);
        if (other == e2.attributes.end()) {
            diffs.push_back(make_attribute_missing(path, it->first, it->second));
        } else if (other->second != it->second) {
            diffs.push_back(make_attribute_changed(path, it->first, it->second, other->second));
        }
    }

    for (AttributeMap::const_iterator it = e2.attributes.begin(); it != e2.attributes.end(); ++it) {
        if (property_is_ignored(it->first, rules.properties)) continue;
        if (e1.attributes.find(it->first) == e1.attributes.end()) {
            diffs.push_back(make_attribute_extra(path, it->first, it->second));
        }
    }

    if (diffs.size() == before && !records_equal(e1, e2, rules)) {
        diffs.push_back(make_structure_different(path, e1, e2));
    }
    return diffs.size() - before;
}

ComparisonResult compare(const FlatDocument& doc1, const FlatDocument& doc2,
                         const IgnoreRules& rules) {
    ComparisonResult result;
    result.total_elements = std::max(doc1.size(), doc2.size());

    for (const XmlElement& e1 : doc1.elements()) {
        if (element_is_ignored(e1, rules)) {
            result.matched_elements++;
            continue;
        }
        const XmlElement* e2 = doc2.find(e1.path, e1.ordinal);
        if (!e2) {
            result.diffs.push_back(make_element_missing(element_display_path(e1), e1));
            continue;
        }
        if (compare_pair(e1, *e2, rules, result.diffs) == 0) {
            result.matched_elements++;
        }
    }

    for (const XmlElement& e2 : doc2.elements()) {
        if (doc1.find(e2.path, e2.ordinal)) continue;
        result.diffs.push_back(make_element_extra(element_display_path(e2), e2));
    }

    result.matched = result.diffs.empty();
    result.match_ratio = result.total_elements == 0
        ? 1.0
        : (double)result.matched_elements / (double)result.total_elements;

    clog_debug(diff_log(), "compare: %zu/%zu elements matched, %zu diffs",
               result.matched_elements, result.total_elements, result.diffs.size());
    return result;
}

} // namespace xmlcompare
