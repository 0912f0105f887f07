// test_path_matcher_gtest.cpp
// Unit tests for ignore-path and ignore-property matching

#include <gtest/gtest.h>
#include "../xmlcompare/path_matcher.hpp"

using namespace xmlcompare;

TEST(PathMatcher, ExactMatch) {
    EXPECT_TRUE(path_is_ignored("/root/child", {"/root/child"}));
    EXPECT_FALSE(path_is_ignored("/root/child2", {"/root/child"}));
}

TEST(PathMatcher, WildcardSuffix) {
    EXPECT_TRUE(path_is_ignored("/root/child/grandchild", {"/root/*"}));
    EXPECT_FALSE(path_is_ignored("/other/child", {"/root/*"}));
    // plain prefix test, not segment-aware
    EXPECT_TRUE(path_is_ignored("/rooted", {"/root*"}));
    EXPECT_TRUE(path_matches("/anything", "*"));
}

TEST(PathMatcher, TrailingSlashPrefix) {
    EXPECT_TRUE(path_is_ignored("/root", {"/root/"}));
    EXPECT_TRUE(path_is_ignored("/root/a/b", {"/root/"}));
    EXPECT_FALSE(path_is_ignored("/rooted", {"/root/"}));
}

TEST(PathMatcher, WildcardOnlyAtEnd) {
    EXPECT_FALSE(path_matches("/root/x/leaf", "/root/*/leaf"));
    EXPECT_FALSE(path_matches("/root", ""));
}

TEST(PathMatcher, AnyPatternMatches) {
    std::vector<std::string> patterns = {"/a", "/b/*", "/c/"};
    EXPECT_TRUE(path_is_ignored("/b/x", patterns));
    EXPECT_TRUE(path_is_ignored("/c", patterns));
    EXPECT_FALSE(path_is_ignored("/d", patterns));
    EXPECT_FALSE(path_is_ignored("/a", {}));
}

TEST(PathMatcher, PropertyMembership) {
    std::vector<std::string> names = {"id", "timestamp"};
    EXPECT_TRUE(property_is_ignored("id", names));
    EXPECT_FALSE(property_is_ignored("ID", names));
    EXPECT_FALSE(property_is_ignored("time", names));
}
