//
// Created by gregorian-rayne on 1/23/26.
//

#include "depmap/graph/coupling.hpp"

#include <gtest/gtest.h>
#include <algorithm>

namespace depmap::graph
{
    class CouplingMetricsTest : public ::testing::Test {
    protected:
        static DependencyGraph make_graph(const std::vector<std::pair<ModuleId, ModuleId>>& edges,
                                          const std::vector<ModuleId>& isolated = {}) {
            GraphBuilder builder;
            for (const auto& [from, to] : edges) {
                builder.add_edge(from, to);
            }
            for (const auto& node : isolated) {
                builder.add_node(node);
            }
            return builder.build();
        }

        static const CouplingMetric& metric_for(const std::vector<CouplingMetric>& metrics, const ModuleId& id) {
            const auto it = std::ranges::find(metrics, id, &CouplingMetric::module);
            EXPECT_NE(it, metrics.end()) << id;
            return *it;
        }
    };

    TEST_F(CouplingMetricsTest, Chain) {
        const auto metrics = compute_metrics(make_graph({{"a", "b"}, {"b", "c"}}));

        EXPECT_DOUBLE_EQ(metric_for(metrics, "a").instability, 1.0);
        EXPECT_DOUBLE_EQ(metric_for(metrics, "b").instability, 0.5);
        EXPECT_DOUBLE_EQ(metric_for(metrics, "c").instability, 0.0);
        EXPECT_EQ(metric_for(metrics, "b").fan_in, 1u);
        EXPECT_EQ(metric_for(metrics, "b").fan_out, 1u);
    }

    TEST_F(CouplingMetricsTest, MutualImport) {
        const auto metrics = compute_metrics(make_graph({{"a", "b"}, {"b", "a"}}));

        EXPECT_DOUBLE_EQ(metric_for(metrics, "a").instability, 0.5);
        EXPECT_DOUBLE_EQ(metric_for(metrics, "b").instability, 0.5);
    }

    TEST_F(CouplingMetricsTest, WidelyImportedModuleIsStable) {
        const auto metrics = compute_metrics(make_graph({{"a", "d"}, {"b", "d"}, {"c", "d"}}));

        EXPECT_EQ(metric_for(metrics, "d").fan_in, 3u);
        EXPECT_EQ(metric_for(metrics, "d").fan_out, 0u);
        EXPECT_DOUBLE_EQ(metric_for(metrics, "d").instability, 0.0);
    }

    TEST_F(CouplingMetricsTest, IsolatedModuleHasZeroInstability) {
        const auto metrics = compute_metrics(make_graph({}, {"e"}));

        ASSERT_EQ(metrics.size(), 1u);
        EXPECT_EQ(metrics[0].fan_in, 0u);
        EXPECT_EQ(metrics[0].fan_out, 0u);
        EXPECT_DOUBLE_EQ(metrics[0].instability, 0.0);
    }

    TEST_F(CouplingMetricsTest, FanTotalsMatchEdgeCount) {
        const auto graph = make_graph({{"a", "b"}, {"a", "c"}, {"b", "c"}, {"c", "a"}, {"d", "d"}}, {"e"});
        const auto metrics = compute_metrics(graph);

        std::size_t fan_in = 0;
        std::size_t fan_out = 0;
        for (const auto& metric : metrics) {
            fan_in += metric.fan_in;
            fan_out += metric.fan_out;
            EXPECT_GE(metric.instability, 0.0);
            EXPECT_LE(metric.instability, 1.0);
        }
        EXPECT_EQ(metrics.size(), graph.node_count());
        EXPECT_EQ(fan_in, graph.edge_count());
        EXPECT_EQ(fan_out, graph.edge_count());
    }

    TEST_F(CouplingMetricsTest, SortByInstabilityThenName) {
        const auto metrics = compute_metrics(make_graph({{"b", "c"}, {"a", "c"}}), SortKey::Instability);

        ASSERT_EQ(metrics.size(), 3u);
        EXPECT_EQ(metrics[0].module, "a");
        EXPECT_EQ(metrics[1].module, "b");
        EXPECT_EQ(metrics[2].module, "c");
    }

    TEST_F(CouplingMetricsTest, SortByFanIn) {
        const auto metrics = compute_metrics(make_graph({{"a", "c"}, {"b", "c"}, {"a", "b"}}), SortKey::FanIn);

        EXPECT_EQ(metrics[0].module, "c");
        EXPECT_EQ(metrics[1].module, "b");
        EXPECT_EQ(metrics[2].module, "a");
    }

    TEST_F(CouplingMetricsTest, SortByFanOutAndName) {
        const auto graph = make_graph({{"z", "a"}, {"z", "b"}, {"b", "a"}});

        const auto by_fan_out = compute_metrics(graph, SortKey::FanOut);
        EXPECT_EQ(by_fan_out[0].module, "z");
        EXPECT_EQ(by_fan_out[1].module, "b");

        const auto by_name = compute_metrics(graph, SortKey::Name);
        EXPECT_EQ(by_name[0].module, "a");
        EXPECT_EQ(by_name[2].module, "z");
    }

    TEST_F(CouplingMetricsTest, ResortKeepsValues) {
        auto metrics = compute_metrics(make_graph({{"a", "b"}}), SortKey::Name);
        sort_metrics(metrics, SortKey::FanIn);

        EXPECT_EQ(metrics[0].module, "b");
        EXPECT_EQ(metrics[0].fan_in, 1u);
    }

    TEST_F(CouplingMetricsTest, SortKeyParsing) {
        EXPECT_EQ(sort_key_from_string("fan_in").value(), SortKey::FanIn);
        EXPECT_EQ(sort_key_from_string("fan_out").value(), SortKey::FanOut);
        EXPECT_EQ(sort_key_from_string("instability").value(), SortKey::Instability);
        EXPECT_EQ(sort_key_from_string("name").value(), SortKey::Name);
        EXPECT_EQ(to_string(SortKey::FanOut), "fan_out");

        const auto invalid = sort_key_from_string("bogus");
        ASSERT_TRUE(invalid.is_err());
        EXPECT_EQ(invalid.error().code(), ErrorCode::InvalidArgument);
    }

    TEST_F(CouplingMetricsTest, RoundedInstability) {
        CouplingMetric metric;
        metric.instability = 2.0 / 3.0;
        EXPECT_DOUBLE_EQ(rounded_instability(metric), 0.667);
    }
}  // namespace depmap::graph
