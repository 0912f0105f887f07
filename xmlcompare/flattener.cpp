#include "flattener.hpp"
#include "xml_tokenizer.hpp"
#include "../lib/log.h"
#include <vector>

namespace xmlcompare {

static log_category_t* xml_log() { return log_get_category("xml"); }

bool flatten(const std::string& xml, FlatDocument& doc, CompareError& error) {
    doc.clear();

    XmlTokenizer tokenizer(xml);
    XmlEvent event;
    XmlError xml_error;
    std::vector<size_t> stack;     // arena indices of open elements

    while (true) {
        if (!tokenizer.next(event, xml_error)) {
            clog_debug(xml_log(), "flatten: %s", xml_error.describe().c_str());
            doc.clear();
            error.set(CompareErrorKind::PARSE, xml_error.describe());
            return false;
        }

        switch (event.type) {
        case XmlEventType::START: {
            XmlElement element;
            element.name = event.name;
            if (stack.empty()) {
                element.path = "/" + event.name;
            } else {
                element.path = doc.at(stack.back()).path + "/" + event.name;
            }
            for (XmlAttribute& attr : event.attributes) {
                element.attributes[attr.name] = attr.value;
            }
            size_t index = doc.append(std::move(element));
            if (!stack.empty()) doc.at(stack.back()).children.push_back(index);
            stack.push_back(index);
            break;
        }
        case XmlEventType::TEXT:
            // text outside the root element has no owner
            if (!stack.empty()) {
                doc.at(stack.back()).content = optional_string_some(event.text);
            }
            break;
        case XmlEventType::END:
            stack.pop_back();
            break;
        case XmlEventType::END_OF_DOCUMENT:
            clog_debug(xml_log(), "flatten: %zu elements", doc.size());
            return true;
        }
    }
}

} // namespace xmlcompare
