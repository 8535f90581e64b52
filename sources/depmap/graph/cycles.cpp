//
// Created by gregorian-rayne on 1/17/26.
//

#include "depmap/graph/cycles.hpp"

#include <algorithm>

namespace depmap::graph {

    namespace {

        /**
         * Marks every node >= start that can reach start using only
         * nodes >= start.
         */
        void mark_reaching(const DependencyGraph& graph, const std::size_t start, std::vector<char>& reaches) {
            std::ranges::fill(reaches, 0);
            reaches[start] = 1;

            std::vector<std::size_t> pending{start};
            while (!pending.empty()) {
                const auto node = pending.back();
                pending.pop_back();
                for (const auto pred : graph.predecessor_indices(node)) {
                    if (pred > start && !reaches[pred]) {
                        reaches[pred] = 1;
                        pending.push_back(pred);
                    }
                }
            }
        }

        /**
         * Rotation of an index cycle that starts at its smallest index.
         */
        std::vector<std::size_t> rotate_to_min(std::vector<std::size_t> cycle) {
            const auto min_it = std::ranges::min_element(cycle);
            std::ranges::rotate(cycle, min_it);
            return cycle;
        }

        struct Frame {
            std::size_t node;
            std::size_t next_successor;
        };

    }  // namespace

    std::string Cycle::to_string() const {
        std::string out;
        for (const auto& node : nodes) {
            out += node;
            out += " -> ";
        }
        if (!nodes.empty()) {
            out += nodes.front();
        }
        return out;
    }

    Cycle normalize_cycle(std::vector<ModuleId> nodes) {
        if (!nodes.empty()) {
            const auto min_it = std::ranges::min_element(nodes);
            std::ranges::rotate(nodes, min_it);
        }
        return Cycle{std::move(nodes)};
    }

    std::vector<Cycle> find_cycles(
        const DependencyGraph& graph,
        const std::size_t max_cycle_length,
        const std::size_t max_cycles
    ) {
        std::vector<Cycle> cycles;
        if (max_cycle_length == 0 || max_cycles == 0 || graph.empty()) {
            return cycles;
        }

        const std::size_t n = graph.node_count();
        std::set<std::vector<std::size_t>> seen;
        std::vector<char> on_path(n, 0);
        std::vector<char> reaches(n, 0);
        std::vector<std::size_t> path;
        std::vector<Frame> stack;

        for (std::size_t start = 0; start < n && seen.size() < max_cycles; ++start) {
            mark_reaching(graph, start, reaches);

            path.assign(1, start);
            stack.assign(1, Frame{start, 0});
            on_path[start] = 1;

            while (!stack.empty() && seen.size() < max_cycles) {
                Frame& top = stack.back();
                const auto& successors = graph.successor_indices(top.node);

                if (top.next_successor == successors.size()) {
                    on_path[top.node] = 0;
                    path.pop_back();
                    stack.pop_back();
                    continue;
                }

                const auto next = successors[top.next_successor++];
                if (next < start || !reaches[next]) {
                    continue;
                }

                if (on_path[next]) {
                    const auto first = std::ranges::find(path, next);
                    seen.insert(rotate_to_min(std::vector<std::size_t>(first, path.end())));
                    continue;
                }

                if (path.size() >= max_cycle_length) {
                    continue;
                }

                on_path[next] = 1;
                path.push_back(next);
                stack.push_back(Frame{next, 0});
            }
        }

        std::vector<std::vector<std::size_t>> ordered(seen.begin(), seen.end());
        std::ranges::stable_sort(ordered, [](const auto& a, const auto& b) {
            if (a.front() != b.front()) {
                return a.front() < b.front();
            }
            return a.size() < b.size();
        });

        cycles.reserve(ordered.size());
        for (const auto& indices : ordered) {
            Cycle cycle;
            cycle.nodes.reserve(indices.size());
            for (const auto idx : indices) {
                cycle.nodes.push_back(graph.id_at(idx));
            }
            cycles.push_back(std::move(cycle));
        }
        return cycles;
    }

    std::set<std::pair<ModuleId, ModuleId>> cycle_edges(const std::vector<Cycle>& cycles) {
        std::set<std::pair<ModuleId, ModuleId>> edges;
        for (const auto& cycle : cycles) {
            for (std::size_t i = 0; i < cycle.nodes.size(); ++i) {
                edges.emplace(cycle.nodes[i], cycle.nodes[(i + 1) % cycle.nodes.size()]);
            }
        }
        return edges;
    }

}  // namespace depmap::graph
