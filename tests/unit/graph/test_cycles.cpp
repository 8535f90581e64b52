//
// Created by gregorian-rayne on 1/23/26.
//

#include "depmap/graph/cycles.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <string_view>

namespace depmap::graph
{
    namespace {
        DependencyGraph make_graph(const std::vector<std::pair<ModuleId, ModuleId>>& edges) {
            GraphBuilder builder;
            for (const auto& [from, to] : edges) {
                builder.add_edge(from, to);
            }
            return builder.build();
        }
    }

    TEST(CycleDetectionTest, AcyclicGraphHasNoCycles) {
        const auto graph = make_graph({{"a", "b"}, {"b", "c"}, {"a", "c"}});
        EXPECT_TRUE(find_cycles(graph).empty());
    }

    TEST(CycleDetectionTest, EmptyGraph) {
        EXPECT_TRUE(find_cycles(GraphBuilder().build()).empty());
    }

    TEST(CycleDetectionTest, MutualImport) {
        const auto graph = make_graph({{"b", "a"}, {"a", "b"}});
        const auto cycles = find_cycles(graph);

        ASSERT_EQ(cycles.size(), 1u);
        EXPECT_EQ(cycles[0].nodes, (std::vector<ModuleId>{"a", "b"}));
        EXPECT_EQ(cycles[0].to_string(), "a -> b -> a");
    }

    TEST(CycleDetectionTest, SelfImportIsCycleOfOne) {
        const auto cycles = find_cycles(make_graph({{"a", "a"}}));

        ASSERT_EQ(cycles.size(), 1u);
        EXPECT_EQ(cycles[0].length(), 1u);
        EXPECT_EQ(cycles[0].to_string(), "a -> a");
    }

    TEST(CycleDetectionTest, TriangleStartsAtSmallestId) {
        const auto cycles = find_cycles(make_graph({{"c", "a"}, {"a", "b"}, {"b", "c"}}));

        ASSERT_EQ(cycles.size(), 1u);
        EXPECT_EQ(cycles[0].nodes, (std::vector<ModuleId>{"a", "b", "c"}));
    }

    TEST(CycleDetectionTest, FindsEveryElementaryCycle) {
        // a <-> b, b -> c -> a, d <-> e
        const auto graph = make_graph({
            {"a", "b"}, {"b", "a"}, {"b", "c"}, {"c", "a"}, {"d", "e"}, {"e", "d"}
        });
        const auto cycles = find_cycles(graph);

        ASSERT_EQ(cycles.size(), 3u);
        EXPECT_EQ(cycles[0].to_string(), "a -> b -> a");
        EXPECT_EQ(cycles[1].to_string(), "a -> b -> c -> a");
        EXPECT_EQ(cycles[2].to_string(), "d -> e -> d");
    }

    TEST(CycleDetectionTest, MaxLengthBoundsResults) {
        const auto graph = make_graph({{"a", "b"}, {"b", "a"}, {"b", "c"}, {"c", "a"}});

        const auto short_only = find_cycles(graph, 2);
        ASSERT_EQ(short_only.size(), 1u);
        EXPECT_EQ(short_only[0].length(), 2u);

        EXPECT_TRUE(find_cycles(graph, 0).empty());
        EXPECT_EQ(find_cycles(graph, 3).size(), 2u);
    }

    TEST(CycleDetectionTest, MaxCyclesStopsDenseSearch) {
        // every module imports every other: 84 elementary cycles
        std::vector<std::pair<ModuleId, ModuleId>> edges;
        for (const auto* from : {"m0", "m1", "m2", "m3", "m4"}) {
            for (const auto* to : {"m0", "m1", "m2", "m3", "m4"}) {
                if (std::string_view(from) != to) {
                    edges.emplace_back(from, to);
                }
            }
        }
        const auto graph = make_graph(edges);

        const auto all = find_cycles(graph);
        EXPECT_EQ(all.size(), 84u);

        const auto capped = find_cycles(graph, DEFAULT_MAX_CYCLE_LENGTH, 10);
        ASSERT_EQ(capped.size(), 10u);
        for (const auto& cycle : capped) {
            EXPECT_EQ(cycle, normalize_cycle(cycle.nodes));
            EXPECT_NE(std::ranges::find(all, cycle), all.end()) << cycle.to_string();
        }
    }

    TEST(CycleDetectionTest, DeterministicAcrossRuns) {
        const auto graph = make_graph({
            {"x", "y"}, {"y", "z"}, {"z", "x"}, {"y", "x"}, {"m", "m"}
        });

        const auto first = find_cycles(graph);
        const auto second = find_cycles(graph);
        ASSERT_EQ(first.size(), second.size());
        for (std::size_t i = 0; i < first.size(); ++i) {
            EXPECT_EQ(first[i].nodes, second[i].nodes);
        }
    }

    TEST(CycleDetectionTest, NormalizeCycle) {
        EXPECT_EQ(normalize_cycle({"c", "a", "b"}).nodes, (std::vector<ModuleId>{"a", "b", "c"}));
        EXPECT_TRUE(normalize_cycle({}).nodes.empty());
    }

    TEST(CycleDetectionTest, CycleEdges) {
        const auto edges = cycle_edges({Cycle{{"a", "b"}}, Cycle{{"c"}}});

        EXPECT_EQ(edges.size(), 3u);
        EXPECT_TRUE(edges.contains({"a", "b"}));
        EXPECT_TRUE(edges.contains({"b", "a"}));
        EXPECT_TRUE(edges.contains({"c", "c"}));
    }
}  // namespace depmap::graph
