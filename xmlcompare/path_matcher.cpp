#include "path_matcher.hpp"

namespace xmlcompare {

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool path_matches(const std::string& path, const std::string& pattern) {
    if (pattern == path) return true;
    if (pattern.empty()) return false;

    char last = pattern[pattern.size() - 1];
    if (last == '*') {
        return starts_with(path, pattern.substr(0, pattern.size() - 1));
    }
    if (last == '/') {
        return starts_with(path, pattern) || starts_with(path + "/", pattern);
    }
    return false;
}

bool path_is_ignored(const std::string& path, const std::vector<std::string>& patterns) {
    for (const std::string& pattern : patterns) {
        if (path_matches(path, pattern)) return true;
    }
    return false;
}

bool property_is_ignored(const std::string& name, const std::vector<std::string>& names) {
    for (const std::string& candidate : names) {
        if (candidate == name) return true;
    }
    return false;
}

} // namespace xmlcompare
