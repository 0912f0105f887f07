#pragma once
#ifndef XMLCOMPARE_PATH_MATCHER_HPP
#define XMLCOMPARE_PATH_MATCHER_HPP

#include <string>
#include <vector>

namespace xmlcompare {

// Ignore rules shared by every element of one comparison
struct IgnoreRules {
    std::vector<std::string> paths;         // exact, "prefix*" or "prefix/"
    std::vector<std::string> properties;    // attribute keys or tag names
};

/**
 * Match one structural path against one ignore pattern.
 *
 * - exact string equality matches
 * - "prefix*" matches any path starting with prefix
 * - "prefix/" matches any path starting with it, and the parent path itself
 *   ("/root" matches "/root/")
 */
bool path_matches(const std::string& path, const std::string& pattern);

// True if any pattern matches; first match wins
bool path_is_ignored(const std::string& path, const std::vector<std::string>& patterns);

// Set membership of an attribute key or tag name
bool property_is_ignored(const std::string& name, const std::vector<std::string>& names);

} // namespace xmlcompare

#endif // XMLCOMPARE_PATH_MATCHER_HPP
