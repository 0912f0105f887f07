#pragma once
#ifndef XMLCOMPARE_XML_ELEMENT_HPP
#define XMLCOMPARE_XML_ELEMENT_HPP

#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace xmlcompare {

// ============================================================================
// Optional value types (avoiding std::optional)
// ============================================================================

struct OptionalString {
    std::string value;
    bool has_value;
};

inline OptionalString optional_string_none() {
    return {std::string(), false};
}

inline OptionalString optional_string_some(const std::string& v) {
    return {v, true};
}

// absent equals absent; absent never equals present, even when empty
inline bool optional_string_equal(const OptionalString& a, const OptionalString& b) {
    if (a.has_value != b.has_value) return false;
    return !a.has_value || a.value == b.value;
}

// ============================================================================
// Element records
// ============================================================================

typedef std::map<std::string, std::string> AttributeMap;

/**
 * One flattened XML element.
 *
 * path is the slash-delimited chain of ancestor tag names ("/root/child"),
 * without sibling index. Elements sharing a path are told apart by ordinal,
 * their 0-based position among all records with that path in document order.
 */
struct XmlElement {
    std::string name;
    AttributeMap attributes;
    OptionalString content;
    std::string path;
    size_t ordinal;
    std::vector<size_t> children;   // arena indices of child elements

    XmlElement() : content(optional_string_none()), ordinal(0) {}
};

/**
 * Arena of element records in start-tag order, with a secondary index from
 * structural path to the arena indices carrying that path.
 */
class FlatDocument {
private:
    std::vector<XmlElement> elements_;
    std::unordered_map<std::string, std::vector<size_t>> path_index_;

public:
    FlatDocument() {}

    // Appends a record, assigning its ordinal; returns its arena index
    size_t append(XmlElement element);

    size_t size() const { return elements_.size(); }
    bool empty() const { return elements_.empty(); }

    XmlElement& at(size_t index) { return elements_[index]; }
    const XmlElement& at(size_t index) const { return elements_[index]; }
    const std::vector<XmlElement>& elements() const { return elements_; }

    // Record with the given path and ordinal, or nullptr
    const XmlElement* find(const std::string& path, size_t ordinal = 0) const;

    // Number of records sharing a path
    size_t countAt(const std::string& path) const;

    void clear() {
        elements_.clear();
        path_index_.clear();
    }
};

// XmlElement { name: "a", attributes: {"c": "C"}, content: Some("hey") }
std::string element_debug_string(const XmlElement& element);

// Path used in diffs: "/r/i" for the first record, "/r/i[2]" for the second
std::string element_display_path(const XmlElement& element);

} // namespace xmlcompare

#endif // XMLCOMPARE_XML_ELEMENT_HPP
