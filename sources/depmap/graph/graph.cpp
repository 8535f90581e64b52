//
// Created by gregorian-rayne on 1/17/26.
//

#include "depmap/graph/graph.hpp"

#include <algorithm>

namespace depmap::graph {

    // ============================================================================
    // DependencyGraph
    // ============================================================================

    std::optional<std::size_t> DependencyGraph::index_of(const ModuleId& node) const {
        if (const auto it = index_.find(node); it != index_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool DependencyGraph::has_node(const ModuleId& node) const {
        return index_.contains(node);
    }

    bool DependencyGraph::has_edge(const ModuleId& from, const ModuleId& to) const {
        const auto from_idx = index_of(from);
        const auto to_idx = index_of(to);
        if (!from_idx || !to_idx) {
            return false;
        }
        return std::ranges::binary_search(successors_[*from_idx], *to_idx);
    }

    std::vector<ModuleId> DependencyGraph::successors(const ModuleId& node) const {
        std::vector<ModuleId> result;
        if (const auto idx = index_of(node)) {
            result.reserve(successors_[*idx].size());
            for (const auto succ : successors_[*idx]) {
                result.push_back(ids_[succ]);
            }
        }
        return result;
    }

    std::vector<ModuleId> DependencyGraph::predecessors(const ModuleId& node) const {
        std::vector<ModuleId> result;
        if (const auto idx = index_of(node)) {
            result.reserve(predecessors_[*idx].size());
            for (const auto pred : predecessors_[*idx]) {
                result.push_back(ids_[pred]);
            }
        }
        return result;
    }

    std::vector<Edge> DependencyGraph::edges() const {
        std::vector<Edge> result;
        result.reserve(edge_count_);
        for (std::size_t from = 0; from < ids_.size(); ++from) {
            for (const auto to : successors_[from]) {
                result.push_back({ids_[from], ids_[to]});
            }
        }
        return result;
    }

    NodeStats DependencyGraph::node_stats(const ModuleId& node) const {
        NodeStats stats;
        stats.node = node;
        if (const auto idx = index_of(node)) {
            stats.in_degree = predecessors_[*idx].size();
            stats.out_degree = successors_[*idx].size();
        }
        return stats;
    }

    std::vector<ModuleId> DependencyGraph::roots() const {
        std::vector<ModuleId> result;
        for (std::size_t i = 0; i < ids_.size(); ++i) {
            if (predecessors_[i].empty()) {
                result.push_back(ids_[i]);
            }
        }
        return result;
    }

    std::vector<ModuleId> DependencyGraph::leaves() const {
        std::vector<ModuleId> result;
        for (std::size_t i = 0; i < ids_.size(); ++i) {
            if (successors_[i].empty()) {
                result.push_back(ids_[i]);
            }
        }
        return result;
    }

    // ============================================================================
    // GraphBuilder
    // ============================================================================

    void GraphBuilder::add_node(const ModuleId& node) {
        nodes_.insert(node);
    }

    void GraphBuilder::add_edge(const ModuleId& from, const ModuleId& to) {
        nodes_.insert(from);
        nodes_.insert(to);
        edges_.emplace(from, to);
    }

    DependencyGraph GraphBuilder::build() const {
        DependencyGraph graph;
        graph.ids_.assign(nodes_.begin(), nodes_.end());
        graph.index_.reserve(graph.ids_.size());
        for (std::size_t i = 0; i < graph.ids_.size(); ++i) {
            graph.index_.emplace(graph.ids_[i], i);
        }

        graph.successors_.resize(graph.ids_.size());
        graph.predecessors_.resize(graph.ids_.size());

        // edges_ is ordered by (from, to) and ids_ by id, so both
        // adjacency directions come out sorted without a second pass.
        for (const auto& [from, to] : edges_) {
            const auto from_idx = graph.index_.at(from);
            const auto to_idx = graph.index_.at(to);
            graph.successors_[from_idx].push_back(to_idx);
            graph.predecessors_[to_idx].push_back(from_idx);
        }

        graph.edge_count_ = edges_.size();
        return graph;
    }

    // ============================================================================
    // Queries
    // ============================================================================

    Result<std::vector<ModuleId>, Error> imports_of(const DependencyGraph& graph, const ModuleId& module) {
        if (!graph.has_node(module)) {
            return Result<std::vector<ModuleId>, Error>::failure(
                Error::not_found("Module not found", module)
            );
        }
        return Result<std::vector<ModuleId>, Error>::success(graph.successors(module));
    }

    Result<std::vector<ModuleId>, Error> importers_of(const DependencyGraph& graph, const ModuleId& module) {
        if (!graph.has_node(module)) {
            return Result<std::vector<ModuleId>, Error>::failure(
                Error::not_found("Module not found", module)
            );
        }
        return Result<std::vector<ModuleId>, Error>::success(graph.predecessors(module));
    }

}  // namespace depmap::graph
