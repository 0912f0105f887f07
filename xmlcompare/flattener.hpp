#pragma once
#ifndef XMLCOMPARE_FLATTENER_HPP
#define XMLCOMPARE_FLATTENER_HPP

#include "compare_error.hpp"
#include "xml_element.hpp"
#include <string>

namespace xmlcompare {

/**
 * Parse one XML document into its flat element arena.
 *
 * Each start tag becomes one record keyed by its structural path. Text is
 * assigned to the innermost open element; when an element holds several text
 * runs only the last one is kept.
 *
 * @param xml   document text
 * @param doc   receives the records (cleared first)
 * @param error set to a PARSE error carrying the tokenizer message on failure
 * @return false on malformed input; doc is then left empty
 */
bool flatten(const std::string& xml, FlatDocument& doc, CompareError& error);

} // namespace xmlcompare

#endif // XMLCOMPARE_FLATTENER_HPP
