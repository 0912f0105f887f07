#pragma once
#ifndef XMLCOMPARE_XML_TOKENIZER_HPP
#define XMLCOMPARE_XML_TOKENIZER_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace xmlcompare {

// Source location tracking - 1-based line and column numbers
struct SourceLocation {
    size_t offset;      // Byte offset in source (0-based)
    size_t line;        // Line number (1-based)
    size_t column;      // Column number (1-based, in bytes)

    SourceLocation() : offset(0), line(1), column(1) {}
    SourceLocation(size_t off, size_t ln, size_t col)
        : offset(off), line(ln), column(col) {}
};

enum class XmlEventType {
    START,              // <tag a="v"> (also emitted for <tag/>)
    TEXT,               // trimmed, entity-decoded character data or CDATA
    END,                // </tag> (also emitted right after a self-closing START)
    END_OF_DOCUMENT
};

struct XmlAttribute {
    std::string name;
    std::string value;
};

struct XmlEvent {
    XmlEventType type;
    std::string name;                       // START and END
    std::vector<XmlAttribute> attributes;   // START, in source order
    std::string text;                       // TEXT
    size_t offset;                          // byte offset of the construct

    XmlEvent() : type(XmlEventType::END_OF_DOCUMENT), offset(0) {}
};

struct XmlError {
    SourceLocation location;
    std::string message;

    // "line 3, column 7: end tag </b> does not match open element <a>"
    std::string describe() const;
};

/**
 * Pull tokenizer over an in-memory XML document.
 *
 * Skips the XML declaration, processing instructions, comments and DOCTYPE.
 * Stops at the first lexical error; after an error or END_OF_DOCUMENT every
 * further call repeats the same outcome.
 */
class XmlTokenizer {
private:
    static const size_t MAX_DEPTH = 512;

    const char* source_;        // Source text (not owned)
    const char* current_;
    const char* end_;

    std::vector<std::string> open_elements_;
    bool pending_end_;          // self-closing tag awaiting its END event
    bool finished_;
    bool failed_;
    XmlError error_;

    bool fail(const char* at, const std::string& message, XmlError& error);
    bool readName(std::string& name);
    bool readStartTag(XmlEvent& event, XmlError& error);
    bool readEndTag(XmlEvent& event, XmlError& error);
    bool readText(XmlEvent& event);
    bool skipUntil(const char* construct_start, const char* terminator,
                   const char* what, XmlError& error);
    bool skipDoctype(XmlError& error);
    void skipWhitespace();

public:
    explicit XmlTokenizer(const std::string& source);
    XmlTokenizer(const char* source, size_t len);

    // Non-copyable
    XmlTokenizer(const XmlTokenizer&) = delete;
    XmlTokenizer& operator=(const XmlTokenizer&) = delete;

    // Produces the next event; returns false and fills error on malformed input
    bool next(XmlEvent& event, XmlError& error);

    size_t depth() const { return open_elements_.size(); }

    SourceLocation locate(size_t offset) const;
};

// Decodes &lt; &gt; &amp; &quot; &apos; and numeric character references;
// unknown or unterminated references are kept verbatim
std::string decode_entities(const char* start, const char* end);

} // namespace xmlcompare

#endif // XMLCOMPARE_XML_TOKENIZER_HPP
