//
// Created by gregorian-rayne on 1/18/26.
//

#ifndef DEPMAP_TREE_HPP
#define DEPMAP_TREE_HPP

/**
 * @file tree.hpp
 * @brief Orphan detection and dependency tree derivation.
 */

#include "depmap/graph/graph.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace depmap::graph {

    // ============================================================================
    // Orphans
    // ============================================================================

    enum class OrphanKind {
        EntryPoint,     ///< fan_in 0, imports other local modules
        Standalone      ///< fan_in 0, fan_out 0
    };

    [[nodiscard]] std::string_view to_string(OrphanKind kind) noexcept;

    struct Orphan {
        ModuleId module;
        std::size_t fan_out = 0;
        OrphanKind kind = OrphanKind::Standalone;
    };

    /**
     * Modules no local module imports, ascending by id.
     */
    [[nodiscard]] std::vector<Orphan> find_orphans(const DependencyGraph& graph);

    // ============================================================================
    // Tree
    // ============================================================================

    constexpr std::size_t DEFAULT_TREE_DEPTH = 10;

    /**
     * One printed occurrence of a module. Children are indices into
     * DependencyTree::nodes.
     */
    struct TreeNode {
        ModuleId module;
        std::size_t depth = 0;
        bool cycle_closing = false;     ///< module was already on the path
        bool depth_limited = false;     ///< successors cut by max_depth
        std::vector<std::size_t> children;
    };

    struct DependencyTree {
        std::vector<TreeNode> nodes;
        std::vector<std::size_t> roots;

        [[nodiscard]] bool empty() const noexcept { return roots.empty(); }
    };

    /**
     * Depth-first expansion of the graph into a tree.
     *
     * Starts at `start` when given, otherwise at every module with no
     * importers (every module when there are none). A module is expanded
     * once per path; meeting a module already on the current path adds a
     * cycle-closing leaf. Nodes at max_depth are not expanded. Successors
     * are visited in ascending id order.
     *
     * @return NotFound when `start` is not a module of the graph.
     */
    [[nodiscard]] Result<DependencyTree, Error> render_tree(
        const DependencyGraph& graph,
        const std::optional<ModuleId>& start = std::nullopt,
        std::size_t max_depth = DEFAULT_TREE_DEPTH
    );

    /**
     * ASCII rendering with "|-- " / "`-- " connectors, " [circular]" on
     * cycle-closing leaves and " [...]" on depth-limited nodes. Root
     * trees are separated by a blank line.
     */
    [[nodiscard]] std::string format_tree(const DependencyTree& tree);

}  // namespace depmap::graph

#endif //DEPMAP_TREE_HPP
