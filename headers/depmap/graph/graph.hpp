//
// Created by gregorian-rayne on 1/17/26.
//

#ifndef DEPMAP_GRAPH_HPP
#define DEPMAP_GRAPH_HPP

/**
 * @file graph.hpp
 * @brief Immutable module dependency graph.
 *
 * Nodes are module ids stored in ascending order; a node's index is its
 * rank in that order, so index order and id order agree. Adjacency is
 * kept as sorted index vectors in both directions. A graph is only
 * produced by GraphBuilder::build() and never changes afterwards, which
 * makes it safe to share between concurrent readers.
 */

#include "depmap/types.hpp"
#include "depmap/result.hpp"
#include "depmap/error.hpp"

#include <compare>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace depmap::graph {

    /**
     * A directed import edge: from imports to.
     */
    struct Edge {
        ModuleId from;
        ModuleId to;

        auto operator<=>(const Edge&) const = default;
    };

    /**
     * Degree summary of one node.
     */
    struct NodeStats {
        ModuleId node;
        std::size_t in_degree = 0;
        std::size_t out_degree = 0;
    };

    class DependencyGraph {
    public:
        /**
         * Creates an empty graph.
         */
        DependencyGraph() = default;

        [[nodiscard]] std::size_t node_count() const noexcept { return ids_.size(); }
        [[nodiscard]] std::size_t edge_count() const noexcept { return edge_count_; }
        [[nodiscard]] bool empty() const noexcept { return ids_.empty(); }

        /**
         * All node ids in ascending order.
         */
        [[nodiscard]] const std::vector<ModuleId>& nodes() const noexcept { return ids_; }

        [[nodiscard]] bool has_node(const ModuleId& node) const;
        [[nodiscard]] bool has_edge(const ModuleId& from, const ModuleId& to) const;

        /**
         * Modules imported by node, ascending. Empty for unknown ids.
         */
        [[nodiscard]] std::vector<ModuleId> successors(const ModuleId& node) const;

        /**
         * Modules importing node, ascending. Empty for unknown ids.
         */
        [[nodiscard]] std::vector<ModuleId> predecessors(const ModuleId& node) const;

        /**
         * All edges ordered by (from, to).
         */
        [[nodiscard]] std::vector<Edge> edges() const;

        [[nodiscard]] NodeStats node_stats(const ModuleId& node) const;

        /**
         * Nodes with no incoming edges, ascending.
         */
        [[nodiscard]] std::vector<ModuleId> roots() const;

        /**
         * Nodes with no outgoing edges, ascending.
         */
        [[nodiscard]] std::vector<ModuleId> leaves() const;

        // Index-level access for traversal algorithms.

        [[nodiscard]] std::optional<std::size_t> index_of(const ModuleId& node) const;
        [[nodiscard]] const ModuleId& id_at(std::size_t index) const { return ids_.at(index); }
        [[nodiscard]] const std::vector<std::size_t>& successor_indices(std::size_t index) const { return successors_.at(index); }
        [[nodiscard]] const std::vector<std::size_t>& predecessor_indices(std::size_t index) const { return predecessors_.at(index); }

    private:
        friend class GraphBuilder;

        std::vector<ModuleId> ids_;
        std::unordered_map<ModuleId, std::size_t> index_;
        std::vector<std::vector<std::size_t>> successors_;
        std::vector<std::vector<std::size_t>> predecessors_;
        std::size_t edge_count_ = 0;
    };

    /**
     * Collects nodes and edges, then freezes them into a DependencyGraph.
     *
     * Duplicate edges collapse, self-edges are kept, and edge endpoints
     * become nodes automatically.
     */
    class GraphBuilder {
    public:
        void add_node(const ModuleId& node);
        void add_edge(const ModuleId& from, const ModuleId& to);

        [[nodiscard]] DependencyGraph build() const;

    private:
        std::set<ModuleId> nodes_;
        std::set<std::pair<ModuleId, ModuleId>> edges_;
    };

    // ============================================================================
    // Queries
    // ============================================================================

    /**
     * Local modules a module imports, ascending.
     * @return NotFound for an unknown module id.
     */
    [[nodiscard]] Result<std::vector<ModuleId>, Error> imports_of(
        const DependencyGraph& graph,
        const ModuleId& module
    );

    /**
     * Local modules importing a module, ascending.
     * @return NotFound for an unknown module id.
     */
    [[nodiscard]] Result<std::vector<ModuleId>, Error> importers_of(
        const DependencyGraph& graph,
        const ModuleId& module
    );

}  // namespace depmap::graph

#endif //DEPMAP_GRAPH_HPP
