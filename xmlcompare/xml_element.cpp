#include "xml_element.hpp"

namespace xmlcompare {

size_t FlatDocument::append(XmlElement element) {
    std::vector<size_t>& slots = path_index_[element.path];
    element.ordinal = slots.size();
    size_t index = elements_.size();
    slots.push_back(index);
    elements_.push_back(std::move(element));
    return index;
}

const XmlElement* FlatDocument::find(const std::string& path, size_t ordinal) const {
    auto it = path_index_.find(path);
    if (it == path_index_.end() || ordinal >= it->second.size()) return nullptr;
    return &elements_[it->second[ordinal]];
}

size_t FlatDocument::countAt(const std::string& path) const {
    auto it = path_index_.find(path);
    return it == path_index_.end() ? 0 : it->second.size();
}

static void append_quoted(std::string& out, const std::string& s) {
    out += '"';
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
}

std::string element_debug_string(const XmlElement& element) {
    std::string out = "XmlElement { name: ";
    append_quoted(out, element.name);
    out += ", attributes: {";
    bool first = true;
    for (const auto& attr : element.attributes) {
        if (!first) out += ", ";
        first = false;
        append_quoted(out, attr.first);
        out += ": ";
        append_quoted(out, attr.second);
    }
    out += "}, content: ";
    if (element.content.has_value) {
        out += "Some(";
        append_quoted(out, element.content.value);
        out += ")";
    } else {
        out += "None";
    }
    out += " }";
    return out;
}

std::string element_display_path(const XmlElement& element) {
    if (element.ordinal == 0) return element.path;
    return element.path + "[" + std::to_string(element.ordinal + 1) + "]";
}

} // namespace xmlcompare
