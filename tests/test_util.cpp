/**
 * @file test_util.cpp
 * @brief Tests for utility functions
 */

#include <gtest/gtest.h>
#include "fieldmerge/Util.hpp"

#include <cstdlib>

using namespace fieldmerge;

TEST(DeepMerge, NestedObjectsMerge) {
    nlohmann::json a = {{"merge", {{"prune_dangling", false}}}, {"output", {{"indent", 2}}}};
    deep_merge(a, {{"output", {{"format", "toml"}}}});
    EXPECT_EQ(a, nlohmann::json::parse(
        R"({"merge":{"prune_dangling":false},"output":{"indent":2,"format":"toml"}})"));
}

TEST(DeepMerge, NonObjectReplaces) {
    nlohmann::json a = {{"x", {{"y", 1}}}};
    deep_merge(a, {{"x", 5}});
    EXPECT_EQ(a["x"], 5);
}

TEST(Split, DropsEmptyTokens) {
    EXPECT_EQ(split("merge__prune", '_'), (std::vector<std::string>{"merge", "prune"}));
}

TEST(Trim, Whitespace) {
    EXPECT_EQ(trim("  a b \t\n"), "a b");
    EXPECT_EQ(trim("   "), "");
}

TEST(ParseOverrides, TypedValues) {
    auto out = parse_overrides("merge.prune_dangling:true, output.indent:4, output.format:toml");
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out["merge.prune_dangling"], true);
    EXPECT_EQ(out["output.indent"], 4);
    EXPECT_EQ(out["output.format"], "toml");
}

TEST(ParseOverrides, CommasInsideCompoundValues) {
    auto out = parse_overrides(R"(a:[1,2],b:{"x":1,"y":2},c:"p,q")");
    EXPECT_EQ(out["a"], nlohmann::json::parse("[1,2]"));
    EXPECT_EQ(out["b"], nlohmann::json::parse(R"({"x":1,"y":2})"));
    EXPECT_EQ(out["c"], "p,q");
}

TEST(ParseOverrides, SkipsMalformedPairs) {
    EXPECT_TRUE(parse_overrides("").empty());
    EXPECT_TRUE(parse_overrides("novalue, :3").empty());
}

TEST(EnumerateEnvironment, SeesVariables) {
    setenv("FIELDMERGE_UTIL_TEST", "1", 1);
    bool found = false;
    for (const auto& [name, value] : enumerate_environment()) {
        if (name == "FIELDMERGE_UTIL_TEST") found = value == "1";
    }
    unsetenv("FIELDMERGE_UTIL_TEST");
    EXPECT_TRUE(found);
}
