//
// Created by gregorian-rayne on 1/17/26.
//

#ifndef DEPMAP_CYCLES_HPP
#define DEPMAP_CYCLES_HPP

/**
 * @file cycles.hpp
 * @brief Circular import detection.
 */

#include "depmap/graph/graph.hpp"

#include <set>
#include <string>
#include <utility>
#include <vector>

namespace depmap::graph {

    constexpr std::size_t DEFAULT_MAX_CYCLE_LENGTH = 20;

    /**
     * Densely connected packages hold exponentially many elementary
     * cycles; the length cap alone does not bound the search there.
     */
    constexpr std::size_t DEFAULT_MAX_CYCLES = 10000;

    /**
     * An elementary cycle in canonical form: rotated so the smallest id
     * comes first, closing node not repeated. A self-import is a cycle
     * of length 1.
     */
    struct Cycle {
        std::vector<ModuleId> nodes;

        [[nodiscard]] std::size_t length() const noexcept { return nodes.size(); }

        /**
         * Renders "a -> b -> a".
         */
        [[nodiscard]] std::string to_string() const;

        bool operator==(const Cycle&) const = default;
    };

    /**
     * Finds every distinct elementary cycle of at most max_cycle_length
     * modules.
     *
     * Each node is tried as a start in ascending order; the depth-first
     * search from a start only enters larger ids that can still reach the
     * start, so every cycle is reported once, from its smallest member.
     * Paths that grow past max_cycle_length are abandoned, and the whole
     * search stops once max_cycles distinct cycles are known. The search
     * uses an explicit stack, never recursion.
     *
     * @return Cycles ordered by start id, then length, then members.
     */
    [[nodiscard]] std::vector<Cycle> find_cycles(
        const DependencyGraph& graph,
        std::size_t max_cycle_length = DEFAULT_MAX_CYCLE_LENGTH,
        std::size_t max_cycles = DEFAULT_MAX_CYCLES
    );

    /**
     * Rotates a cycle so that its smallest id comes first.
     */
    [[nodiscard]] Cycle normalize_cycle(std::vector<ModuleId> nodes);

    /**
     * Every (from, to) edge that lies on one of the cycles.
     */
    [[nodiscard]] std::set<std::pair<ModuleId, ModuleId>> cycle_edges(const std::vector<Cycle>& cycles);

}  // namespace depmap::graph

#endif //DEPMAP_CYCLES_HPP
