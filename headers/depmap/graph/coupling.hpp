//
// Created by gregorian-rayne on 1/18/26.
//

#ifndef DEPMAP_COUPLING_HPP
#define DEPMAP_COUPLING_HPP

/**
 * @file coupling.hpp
 * @brief Fan-in, fan-out and instability per module.
 *
 * instability = fan_out / (fan_in + fan_out), 0 for an isolated module.
 * 0 means maximally stable (only depended upon), 1 maximally unstable
 * (only depends on others).
 */

#include "depmap/graph/graph.hpp"

#include <string_view>
#include <vector>

namespace depmap::graph {

    struct CouplingMetric {
        ModuleId module;
        std::size_t fan_in = 0;
        std::size_t fan_out = 0;
        double instability = 0.0;
    };

    enum class SortKey {
        Name,           ///< module id ascending
        FanIn,          ///< fan_in descending, ties by id
        FanOut,         ///< fan_out descending, ties by id
        Instability     ///< instability descending, ties by id
    };

    [[nodiscard]] std::string_view to_string(SortKey key) noexcept;

    /**
     * Parses "name", "fan_in", "fan_out" or "instability".
     * @return InvalidArgument for anything else.
     */
    [[nodiscard]] Result<SortKey, Error> sort_key_from_string(std::string_view name);

    /**
     * One metric per node, sorted by key. Never modifies the graph.
     */
    [[nodiscard]] std::vector<CouplingMetric> compute_metrics(
        const DependencyGraph& graph,
        SortKey key = SortKey::Instability
    );

    /**
     * Stable re-sort of already computed metrics.
     */
    void sort_metrics(std::vector<CouplingMetric>& metrics, SortKey key);

    /**
     * Instability rounded to three decimals, as shown in reports.
     */
    [[nodiscard]] double rounded_instability(const CouplingMetric& metric) noexcept;

}  // namespace depmap::graph

#endif //DEPMAP_COUPLING_HPP
