#include "xml_tokenizer.hpp"
#include <cctype>
#include <cstdint>
#include <cstring>

namespace xmlcompare {

static bool is_name_start(unsigned char c) {
    return isalpha(c) || c == '_' || c == ':' || c >= 0x80;
}

static bool is_name_char(unsigned char c) {
    return is_name_start(c) || isdigit(c) || c == '-' || c == '.';
}

static bool is_xml_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

static bool starts_with(const char* p, const char* end, const char* prefix) {
    size_t n = strlen(prefix);
    return (size_t)(end - p) >= n && memcmp(p, prefix, n) == 0;
}

static const char* find_sequence(const char* p, const char* end, const char* seq) {
    size_t n = strlen(seq);
    while ((size_t)(end - p) >= n) {
        if (memcmp(p, seq, n) == 0) return p;
        p++;
    }
    return nullptr;
}

static int unicode_to_utf8(uint32_t cp, char* out) {
    if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0;
    if (cp < 0x80) {
        out[0] = (char)cp;
        return 1;
    }
    if (cp < 0x800) {
        out[0] = (char)(0xC0 | (cp >> 6));
        out[1] = (char)(0x80 | (cp & 0x3F));
        return 2;
    }
    if (cp < 0x10000) {
        out[0] = (char)(0xE0 | (cp >> 12));
        out[1] = (char)(0x80 | ((cp >> 6) & 0x3F));
        out[2] = (char)(0x80 | (cp & 0x3F));
        return 3;
    }
    out[0] = (char)(0xF0 | (cp >> 18));
    out[1] = (char)(0x80 | ((cp >> 12) & 0x3F));
    out[2] = (char)(0x80 | ((cp >> 6) & 0x3F));
    out[3] = (char)(0x80 | (cp & 0x3F));
    return 4;
}

// resolves the reference between '&' and ';' (exclusive); false if unknown
static bool resolve_reference(const char* ref, const char* ref_end, std::string& out) {
    size_t len = ref_end - ref;
    if (len == 0) return false;

    if (*ref == '#') {
        const char* p = ref + 1;
        bool is_hex = false;
        if (p < ref_end && (*p == 'x' || *p == 'X')) {
            is_hex = true;
            p++;
        }
        if (p == ref_end) return false;
        uint32_t value = 0;
        for (; p < ref_end; p++) {
            unsigned char c = (unsigned char)*p;
            uint32_t digit;
            if (isdigit(c)) digit = c - '0';
            else if (is_hex && c >= 'a' && c <= 'f') digit = c - 'a' + 10;
            else if (is_hex && c >= 'A' && c <= 'F') digit = c - 'A' + 10;
            else return false;
            value = value * (is_hex ? 16 : 10) + digit;
            if (value > 0x10FFFF) return false;
        }
        char utf8_buf[4];
        int utf8_len = unicode_to_utf8(value, utf8_buf);
        if (utf8_len == 0) return false;
        out.append(utf8_buf, utf8_len);
        return true;
    }

    static const struct { const char* name; char ch; } predefined[] = {
        {"lt", '<'}, {"gt", '>'}, {"amp", '&'}, {"quot", '"'}, {"apos", '\''},
    };
    for (const auto& entity : predefined) {
        if (strlen(entity.name) == len && memcmp(entity.name, ref, len) == 0) {
            out += entity.ch;
            return true;
        }
    }
    return false;
}

std::string decode_entities(const char* start, const char* end) {
    std::string out;
    out.reserve(end - start);
    const char* p = start;
    while (p < end) {
        if (*p != '&') {
            out += *p++;
            continue;
        }
        // find the terminating ';' without crossing into the next reference
        const char* semi = p + 1;
        while (semi < end && *semi != ';' && *semi != '&' && *semi != '<' && !is_xml_space(*semi)) {
            semi++;
        }
        if (semi < end && *semi == ';' && resolve_reference(p + 1, semi, out)) {
            p = semi + 1;
        } else if (semi < end && *semi == ';') {
            // unknown entity - preserve as-is
            out.append(p, semi + 1 - p);
            p = semi + 1;
        } else {
            out += '&';
            p++;
        }
    }
    return out;
}

std::string XmlError::describe() const {
    return "line " + std::to_string(location.line) + ", column " +
           std::to_string(location.column) + ": " + message;
}

XmlTokenizer::XmlTokenizer(const std::string& source)
    : XmlTokenizer(source.data(), source.size())
{}

XmlTokenizer::XmlTokenizer(const char* source, size_t len)
    : source_(source)
    , current_(source)
    , end_(source + len)
    , pending_end_(false)
    , finished_(false)
    , failed_(false)
{}

SourceLocation XmlTokenizer::locate(size_t offset) const {
    SourceLocation loc;
    size_t limit = offset < (size_t)(end_ - source_) ? offset : (size_t)(end_ - source_);
    for (size_t i = 0; i < limit; i++) {
        if (source_[i] == '\n') {
            loc.line++;
            loc.column = 1;
        } else {
            loc.column++;
        }
    }
    loc.offset = limit;
    return loc;
}

bool XmlTokenizer::fail(const char* at, const std::string& message, XmlError& error) {
    failed_ = true;
    error_.location = locate(at - source_);
    error_.message = message;
    error = error_;
    return false;
}

void XmlTokenizer::skipWhitespace() {
    while (current_ < end_ && is_xml_space(*current_)) current_++;
}

bool XmlTokenizer::readName(std::string& name) {
    const char* start = current_;
    if (current_ >= end_ || !is_name_start((unsigned char)*current_)) return false;
    while (current_ < end_ && is_name_char((unsigned char)*current_)) current_++;
    name.assign(start, current_ - start);
    return true;
}

bool XmlTokenizer::skipUntil(const char* construct_start, const char* terminator,
                             const char* what, XmlError& error) {
    const char* found = find_sequence(current_, end_, terminator);
    if (!found) {
        return fail(construct_start, std::string("unterminated ") + what, error);
    }
    current_ = found + strlen(terminator);
    return true;
}

bool XmlTokenizer::skipDoctype(XmlError& error) {
    const char* decl_start = current_;
    int bracket_depth = 0;
    char quote = 0;
    while (current_ < end_) {
        char c = *current_;
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '[') {
            bracket_depth++;
        } else if (c == ']') {
            if (bracket_depth > 0) bracket_depth--;
        } else if (c == '>' && bracket_depth == 0) {
            current_++;
            return true;
        }
        current_++;
    }
    return fail(decl_start, "unterminated DOCTYPE declaration", error);
}

bool XmlTokenizer::readText(XmlEvent& event) {
    const char* text_start = current_;
    while (current_ < end_ && *current_ != '<') current_++;

    const char* text_end = current_;
    while (text_start < text_end && is_xml_space(*text_start)) text_start++;
    while (text_end > text_start && is_xml_space(*(text_end - 1))) text_end--;

    // whitespace-only runs produce no event
    if (text_end == text_start) return false;

    event.type = XmlEventType::TEXT;
    event.name.clear();
    event.attributes.clear();
    event.text = decode_entities(text_start, text_end);
    event.offset = text_start - source_;
    return true;
}

bool XmlTokenizer::readStartTag(XmlEvent& event, XmlError& error) {
    const char* tag_start = current_;
    current_++; // skip <

    std::string name;
    if (!readName(name)) return fail(tag_start, "invalid or missing tag name", error);

    event.type = XmlEventType::START;
    event.name = name;
    event.attributes.clear();
    event.text.clear();
    event.offset = tag_start - source_;

    bool self_closing = false;
    while (true) {
        skipWhitespace();
        if (current_ >= end_) return fail(tag_start, "unterminated start tag <" + name + ">", error);
        if (*current_ == '>') {
            current_++;
            break;
        }
        if (*current_ == '/') {
            if (current_ + 1 < end_ && current_[1] == '>') {
                current_ += 2;
                self_closing = true;
                break;
            }
            return fail(current_, "expected '>' after '/' in tag <" + name + ">", error);
        }

        const char* attr_start = current_;
        XmlAttribute attr;
        if (!readName(attr.name)) {
            return fail(current_, "invalid attribute name in tag <" + name + ">", error);
        }
        skipWhitespace();
        if (current_ >= end_ || *current_ != '=') {
            return fail(current_, "expected '=' after attribute '" + attr.name + "'", error);
        }
        current_++; // skip =
        skipWhitespace();
        if (current_ >= end_ || (*current_ != '"' && *current_ != '\'')) {
            return fail(current_, "expected quoted value for attribute '" + attr.name + "'", error);
        }

        char quote_char = *current_;
        const char* quote_pos = current_;
        current_++; // skip opening quote
        const char* value_start = current_;
        while (current_ < end_ && *current_ != quote_char) {
            if (*current_ == '<') {
                return fail(current_, "'<' not allowed in value of attribute '" + attr.name + "'", error);
            }
            current_++;
        }
        if (current_ >= end_) {
            return fail(quote_pos, "unterminated value for attribute '" + attr.name + "'", error);
        }
        attr.value = decode_entities(value_start, current_);
        current_++; // skip closing quote

        for (const XmlAttribute& existing : event.attributes) {
            if (existing.name == attr.name) {
                return fail(attr_start, "duplicate attribute '" + attr.name + "' in tag <" + name + ">", error);
            }
        }
        event.attributes.push_back(std::move(attr));

        if (current_ < end_ && !is_xml_space(*current_) && *current_ != '>' && *current_ != '/') {
            return fail(current_, "expected whitespace between attributes in tag <" + name + ">", error);
        }
    }

    if (open_elements_.size() >= MAX_DEPTH) {
        return fail(tag_start, "maximum XML nesting depth (" + std::to_string(MAX_DEPTH) + ") exceeded", error);
    }
    open_elements_.push_back(name);
    pending_end_ = self_closing;
    return true;
}

bool XmlTokenizer::readEndTag(XmlEvent& event, XmlError& error) {
    const char* tag_start = current_;
    current_ += 2; // skip </

    std::string name;
    if (!readName(name)) return fail(tag_start, "invalid or missing end tag name", error);
    skipWhitespace();
    if (current_ >= end_ || *current_ != '>') {
        return fail(tag_start, "unterminated end tag </" + name + ">", error);
    }
    current_++; // skip >

    if (open_elements_.empty()) {
        return fail(tag_start, "unexpected end tag </" + name + ">", error);
    }
    if (open_elements_.back() != name) {
        return fail(tag_start, "end tag </" + name + "> does not match open element <" +
                    open_elements_.back() + ">", error);
    }
    open_elements_.pop_back();

    event.type = XmlEventType::END;
    event.name = name;
    event.attributes.clear();
    event.text.clear();
    event.offset = tag_start - source_;
    return true;
}

bool XmlTokenizer::next(XmlEvent& event, XmlError& error) {
    if (failed_) {
        error = error_;
        return false;
    }

    if (pending_end_) {
        pending_end_ = false;
        event.type = XmlEventType::END;
        event.name = open_elements_.back();
        event.attributes.clear();
        event.text.clear();
        open_elements_.pop_back();
        return true;
    }

    while (!finished_) {
        if (current_ >= end_) {
            if (!open_elements_.empty()) {
                return fail(current_, "unexpected end of document: unclosed element <" +
                            open_elements_.back() + ">", error);
            }
            finished_ = true;
            break;
        }

        if (*current_ != '<') {
            if (readText(event)) return true;
            continue;
        }

        if (starts_with(current_, end_, "<!--")) {
            const char* comment_start = current_;
            current_ += 4;
            if (!skipUntil(comment_start, "-->", "comment", error)) return false;
            continue;
        }

        if (starts_with(current_, end_, "<![CDATA[")) {
            const char* section_start = current_;
            const char* content = current_ + 9;
            const char* close = find_sequence(content, end_, "]]>");
            if (!close) return fail(section_start, "unterminated CDATA section", error);
            current_ = close + 3;

            const char* text_end = close;
            while (content < text_end && is_xml_space(*content)) content++;
            while (text_end > content && is_xml_space(*(text_end - 1))) text_end--;
            if (text_end == content) continue;

            event.type = XmlEventType::TEXT;
            event.name.clear();
            event.attributes.clear();
            event.text.assign(content, text_end - content);
            event.offset = section_start - source_;
            return true;
        }

        if (starts_with(current_, end_, "<!DOCTYPE")) {
            current_ += 9;
            if (!skipDoctype(error)) return false;
            continue;
        }

        if (starts_with(current_, end_, "<!")) {
            return fail(current_, "unsupported markup declaration", error);
        }

        if (starts_with(current_, end_, "<?")) {
            const char* pi_start = current_;
            current_ += 2;
            if (!skipUntil(pi_start, "?>", "processing instruction", error)) return false;
            continue;
        }

        if (starts_with(current_, end_, "</")) {
            return readEndTag(event, error);
        }

        return readStartTag(event, error);
    }

    event.type = XmlEventType::END_OF_DOCUMENT;
    event.name.clear();
    event.attributes.clear();
    event.text.clear();
    event.offset = end_ - source_;
    return true;
}

} // namespace xmlcompare
