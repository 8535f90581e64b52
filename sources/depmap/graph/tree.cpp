//
// Created by gregorian-rayne on 1/18/26.
//

#include "depmap/graph/tree.hpp"

#include <utility>

namespace depmap::graph {

    // ============================================================================
    // Orphans
    // ============================================================================

    std::string_view to_string(const OrphanKind kind) noexcept {
        switch (kind) {
            case OrphanKind::EntryPoint: return "entry point / orchestrator";
            case OrphanKind::Standalone: return "standalone / potential dead code";
        }
        return "unknown";
    }

    std::vector<Orphan> find_orphans(const DependencyGraph& graph) {
        std::vector<Orphan> orphans;
        for (std::size_t i = 0; i < graph.node_count(); ++i) {
            if (!graph.predecessor_indices(i).empty()) {
                continue;
            }
            Orphan orphan;
            orphan.module = graph.id_at(i);
            orphan.fan_out = graph.successor_indices(i).size();
            orphan.kind = orphan.fan_out > 0 ? OrphanKind::EntryPoint : OrphanKind::Standalone;
            orphans.push_back(std::move(orphan));
        }
        return orphans;
    }

    // ============================================================================
    // Tree
    // ============================================================================

    namespace {

        struct WalkFrame {
            std::size_t tree_node;
            std::size_t graph_node;
            std::size_t next_successor;
        };

        std::size_t add_node(DependencyTree& tree, const ModuleId& module, const std::size_t depth) {
            TreeNode node;
            node.module = module;
            node.depth = depth;
            tree.nodes.push_back(std::move(node));
            return tree.nodes.size() - 1;
        }

        void expand(
            const DependencyGraph& graph,
            DependencyTree& tree,
            const std::size_t root,
            const std::size_t max_depth,
            std::vector<char>& on_path
        ) {
            const auto root_node = add_node(tree, graph.id_at(root), 0);
            tree.roots.push_back(root_node);

            std::vector<WalkFrame> stack{{root_node, root, 0}};
            on_path[root] = 1;

            while (!stack.empty()) {
                auto& top = stack.back();
                const auto& successors = graph.successor_indices(top.graph_node);
                const auto depth = tree.nodes[top.tree_node].depth;

                if (depth >= max_depth || top.next_successor == successors.size()) {
                    if (depth >= max_depth && !successors.empty()) {
                        tree.nodes[top.tree_node].depth_limited = true;
                    }
                    on_path[top.graph_node] = 0;
                    stack.pop_back();
                    continue;
                }

                const auto next = successors[top.next_successor++];
                const auto parent = top.tree_node;
                const auto child = add_node(tree, graph.id_at(next), depth + 1);
                tree.nodes[parent].children.push_back(child);

                if (on_path[next]) {
                    tree.nodes[child].cycle_closing = true;
                    continue;
                }

                on_path[next] = 1;
                stack.push_back({child, next, 0});
            }
        }

        struct PrintFrame {
            std::size_t node;
            std::string prefix;
            bool last;
        };

    }  // namespace

    Result<DependencyTree, Error> render_tree(
        const DependencyGraph& graph,
        const std::optional<ModuleId>& start,
        const std::size_t max_depth
    ) {
        DependencyTree tree;
        std::vector<char> on_path(graph.node_count(), 0);

        if (start) {
            const auto idx = graph.index_of(*start);
            if (!idx) {
                return Result<DependencyTree, Error>::failure(
                    Error::not_found("Module not found", *start)
                );
            }
            expand(graph, tree, *idx, max_depth, on_path);
            return Result<DependencyTree, Error>::success(std::move(tree));
        }

        std::vector<std::size_t> roots;
        for (std::size_t i = 0; i < graph.node_count(); ++i) {
            if (graph.predecessor_indices(i).empty()) {
                roots.push_back(i);
            }
        }
        if (roots.empty()) {
            for (std::size_t i = 0; i < graph.node_count(); ++i) {
                roots.push_back(i);
            }
        }

        for (const auto root : roots) {
            expand(graph, tree, root, max_depth, on_path);
        }
        return Result<DependencyTree, Error>::success(std::move(tree));
    }

    std::string format_tree(const DependencyTree& tree) {
        std::string out;

        for (std::size_t r = 0; r < tree.roots.size(); ++r) {
            if (r > 0) {
                out += "\n\n";
            }
            const auto& root = tree.nodes[tree.roots[r]];
            out += root.module;
            if (root.depth_limited) {
                out += " [...]";
            }

            std::vector<PrintFrame> stack;
            for (auto it = root.children.rbegin(); it != root.children.rend(); ++it) {
                stack.push_back({*it, "", it == root.children.rbegin()});
            }

            while (!stack.empty()) {
                auto frame = std::move(stack.back());
                stack.pop_back();

                const auto& node = tree.nodes[frame.node];
                out += '\n';
                out += frame.prefix;
                out += frame.last ? "`-- " : "|-- ";
                out += node.module;
                if (node.cycle_closing) {
                    out += " [circular]";
                } else if (node.depth_limited) {
                    out += " [...]";
                }

                const auto child_prefix = frame.prefix + (frame.last ? "    " : "|   ");
                for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
                    stack.push_back({*it, child_prefix, it == node.children.rbegin()});
                }
            }
        }
        return out;
    }

}  // namespace depmap::graph
