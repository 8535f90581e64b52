//
// Created by gregorian-rayne on 1/23/26.
//

#include "depmap/graph/tree.hpp"

#include <gtest/gtest.h>

namespace depmap::graph
{
    namespace {
        DependencyGraph make_graph(const std::vector<std::pair<ModuleId, ModuleId>>& edges,
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

        std::string render(const DependencyGraph& graph,
                           const std::optional<ModuleId>& start = std::nullopt,
                           const std::size_t depth = DEFAULT_TREE_DEPTH) {
            const auto tree = render_tree(graph, start, depth);
            EXPECT_TRUE(tree.is_ok());
            return tree.is_ok() ? format_tree(tree.value()) : "";
        }
    }

    TEST(OrphanTest, ClassifiesModulesWithoutImporters) {
        const auto orphans = find_orphans(make_graph({{"main", "core"}, {"cli", "core"}}, {"e"}));

        ASSERT_EQ(orphans.size(), 3u);
        EXPECT_EQ(orphans[0].module, "cli");
        EXPECT_EQ(orphans[0].kind, OrphanKind::EntryPoint);
        EXPECT_EQ(orphans[1].module, "e");
        EXPECT_EQ(orphans[1].kind, OrphanKind::Standalone);
        EXPECT_EQ(orphans[1].fan_out, 0u);
        EXPECT_EQ(orphans[2].module, "main");
        EXPECT_EQ(orphans[2].fan_out, 1u);
    }

    TEST(OrphanTest, CycleMembersAreNotOrphans) {
        EXPECT_TRUE(find_orphans(make_graph({{"a", "b"}, {"b", "a"}})).empty());
    }

    TEST(OrphanTest, KindLabels) {
        EXPECT_EQ(to_string(OrphanKind::EntryPoint), "entry point / orchestrator");
        EXPECT_EQ(to_string(OrphanKind::Standalone), "standalone / potential dead code");
    }

    TEST(DependencyTreeTest, RendersFromRoots) {
        const auto graph = make_graph({{"main", "app"}, {"main", "utils"}, {"app", "utils"}});

        EXPECT_EQ(render(graph),
                  "main\n"
                  "|-- app\n"
                  "|   `-- utils\n"
                  "`-- utils");
    }

    TEST(DependencyTreeTest, MutualImportTerminates) {
        const auto tree = render_tree(make_graph({{"a", "b"}, {"b", "a"}}), std::nullopt, DEFAULT_TREE_DEPTH);
        ASSERT_TRUE(tree.is_ok());

        // No module lacks importers, so every module starts a tree.
        EXPECT_EQ(tree.value().roots.size(), 2u);
        EXPECT_EQ(format_tree(tree.value()),
                  "a\n"
                  "`-- b\n"
                  "    `-- a [circular]\n"
                  "\n"
                  "b\n"
                  "`-- a\n"
                  "    `-- b [circular]");
    }

    TEST(DependencyTreeTest, CycleClosingLeafHasNoChildren) {
        const auto tree = render_tree(make_graph({{"a", "a"}}), std::string("a"));
        ASSERT_TRUE(tree.is_ok());

        const auto& nodes = tree.value().nodes;
        ASSERT_EQ(nodes.size(), 2u);
        EXPECT_TRUE(nodes[1].cycle_closing);
        EXPECT_TRUE(nodes[1].children.empty());
    }

    TEST(DependencyTreeTest, StartModule) {
        const auto graph = make_graph({{"main", "app"}, {"app", "db"}});
        EXPECT_EQ(render(graph, std::string("app")), "app\n`-- db");
    }

    TEST(DependencyTreeTest, UnknownStartModule) {
        const auto tree = render_tree(make_graph({{"a", "b"}}), std::string("zzz"));

        ASSERT_TRUE(tree.is_err());
        EXPECT_EQ(tree.error().code(), ErrorCode::NotFound);
    }

    TEST(DependencyTreeTest, DepthLimitMarksCutNodes) {
        const auto graph = make_graph({{"a", "b"}, {"b", "c"}, {"c", "d"}});

        EXPECT_EQ(render(graph, std::nullopt, 1), "a\n`-- b [...]");
        EXPECT_EQ(render(graph, std::nullopt, 0), "a [...]");
    }

    TEST(DependencyTreeTest, SharedModuleRepeatsOnEachPath) {
        const auto graph = make_graph({{"a", "c"}, {"b", "c"}});

        EXPECT_EQ(render(graph), "a\n`-- c\n\nb\n`-- c");
    }

    TEST(DependencyTreeTest, EmptyGraph) {
        const auto tree = render_tree(GraphBuilder().build());
        ASSERT_TRUE(tree.is_ok());
        EXPECT_TRUE(tree.value().empty());
        EXPECT_EQ(format_tree(tree.value()), "");
    }
}  // namespace depmap::graph
