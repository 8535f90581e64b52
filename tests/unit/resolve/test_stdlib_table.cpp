//
// Created by gregorian-rayne on 1/23/26.
//

#include "depmap/resolve/stdlib_table.hpp"

#include <gtest/gtest.h>

namespace depmap::resolve
{
    TEST(StdlibTableTest, PythonTableKnowsCommonModules) {
        const auto table = StdlibTable::python();

        EXPECT_TRUE(table.contains("os"));
        EXPECT_TRUE(table.contains("sys"));
        EXPECT_TRUE(table.contains("json"));
        EXPECT_TRUE(table.contains("typing"));
        EXPECT_TRUE(table.contains("__future__"));
        EXPECT_TRUE(table.contains("tomllib"));
        EXPECT_GT(table.size(), 100u);
    }

    TEST(StdlibTableTest, MatchesOnFirstComponent) {
        const auto table = StdlibTable::python();

        EXPECT_TRUE(table.contains("os.path"));
        EXPECT_TRUE(table.contains("collections.abc"));
        EXPECT_TRUE(table.contains("xml.etree.ElementTree"));
        EXPECT_FALSE(table.contains("osx"));
    }

    TEST(StdlibTableTest, ThirdPartyNotIncluded) {
        const auto table = StdlibTable::python();

        EXPECT_FALSE(table.contains("requests"));
        EXPECT_FALSE(table.contains("numpy.linalg"));
        EXPECT_FALSE(table.contains(""));
    }

    TEST(StdlibTableTest, InjectableTable) {
        StdlibTable table(std::unordered_set<std::string>{"alpha"});
        EXPECT_TRUE(table.contains("alpha.beta"));
        EXPECT_FALSE(table.contains("os"));

        table.add("gamma");
        table.add("");
        table.add_all({"delta", "epsilon"});

        EXPECT_EQ(table.size(), 4u);
        EXPECT_TRUE(table.contains("delta"));
    }
}  // namespace depmap::resolve
