//
// Created by gregorian-rayne on 1/23/26.
//

#include "depmap/utils/string_utils.hpp"

#include <gtest/gtest.h>

namespace depmap::string_utils
{
    TEST(TrimTest, Trim) {
        EXPECT_EQ(trim("  hello  "), "hello");
        EXPECT_EQ(trim("\t\nhello\t\n"), "hello");
        EXPECT_EQ(trim("hello"), "hello");
        EXPECT_EQ(trim("   "), "");
        EXPECT_EQ(trim(""), "");
    }

    TEST(SplitTest, KeepsEmptyParts) {
        const auto parts = split("a,,b,", ',');

        ASSERT_EQ(parts.size(), 4u);
        EXPECT_EQ(parts[0], "a");
        EXPECT_EQ(parts[1], "");
        EXPECT_EQ(parts[2], "b");
        EXPECT_EQ(parts[3], "");
    }

    TEST(SplitTest, NoDelimiter) {
        const auto parts = split("abc", '.');
        ASSERT_EQ(parts.size(), 1u);
        EXPECT_EQ(parts[0], "abc");
    }

    TEST(SplitListTest, TrimsAndDropsEmpties) {
        EXPECT_EQ(split_list(" build, dist ,,tests/fixtures "),
                  (std::vector<std::string>{"build", "dist", "tests/fixtures"}));
        EXPECT_TRUE(split_list(" , ").empty());
    }

    TEST(JoinTest, Join) {
        EXPECT_EQ(join(std::vector<std::string>{"a", "b", "c"}, " -> "), "a -> b -> c");
        EXPECT_EQ(join(std::vector<std::string>{"solo"}, ", "), "solo");
        EXPECT_EQ(join(std::vector<std::string>{}, ", "), "");
    }

    TEST(ReplaceTest, ReplaceAll) {
        EXPECT_EQ(replace_all("app.core.engine", ".", "_"), "app_core_engine");
        EXPECT_EQ(replace_all("aaa", "a", "bb"), "bbbbbb");
        EXPECT_EQ(replace_all("none", "x", "y"), "none");
        EXPECT_EQ(replace_all("same", "", "y"), "same");
    }

    TEST(CaseTest, ToLower) {
        EXPECT_EQ(to_lower("README.MD"), "readme.md");
        EXPECT_EQ(to_lower(""), "");
    }

    TEST(DottedNameTest, FirstComponent) {
        EXPECT_EQ(first_component("os.path"), "os");
        EXPECT_EQ(first_component("json"), "json");
        EXPECT_EQ(first_component(""), "");
    }

    TEST(DottedNameTest, ParentName) {
        EXPECT_EQ(parent_name("app.core.engine"), "app.core");
        EXPECT_EQ(parent_name("app"), "");
    }

    TEST(DottedNameTest, ComponentCount) {
        EXPECT_EQ(component_count(""), 0u);
        EXPECT_EQ(component_count("app"), 1u);
        EXPECT_EQ(component_count("app.core.engine"), 3u);
    }

    TEST(DottedNameTest, JoinDotted) {
        EXPECT_EQ(join_dotted("app", "core"), "app.core");
        EXPECT_EQ(join_dotted("", "core"), "core");
        EXPECT_EQ(join_dotted("app", ""), "app");
    }
}  // namespace depmap::string_utils
