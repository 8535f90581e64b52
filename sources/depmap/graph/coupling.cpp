//
// Created by gregorian-rayne on 1/18/26.
//

#include "depmap/graph/coupling.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace depmap::graph {

    std::string_view to_string(const SortKey key) noexcept {
        switch (key) {
            case SortKey::Name:        return "name";
            case SortKey::FanIn:       return "fan_in";
            case SortKey::FanOut:      return "fan_out";
            case SortKey::Instability: return "instability";
        }
        return "unknown";
    }

    Result<SortKey, Error> sort_key_from_string(const std::string_view name) {
        if (name == "name") return Result<SortKey, Error>::success(SortKey::Name);
        if (name == "fan_in") return Result<SortKey, Error>::success(SortKey::FanIn);
        if (name == "fan_out") return Result<SortKey, Error>::success(SortKey::FanOut);
        if (name == "instability") return Result<SortKey, Error>::success(SortKey::Instability);

        return Result<SortKey, Error>::failure(Error::invalid_argument(
            "Invalid sort key (expected one of: fan_in, fan_out, instability, name)",
            std::string(name)
        ));
    }

    void sort_metrics(std::vector<CouplingMetric>& metrics, const SortKey key) {
        switch (key) {
            case SortKey::Name:
                std::ranges::stable_sort(metrics, {}, &CouplingMetric::module);
                break;
            case SortKey::FanIn:
                std::ranges::stable_sort(metrics, [](const auto& a, const auto& b) {
                    return a.fan_in != b.fan_in ? a.fan_in > b.fan_in : a.module < b.module;
                });
                break;
            case SortKey::FanOut:
                std::ranges::stable_sort(metrics, [](const auto& a, const auto& b) {
                    return a.fan_out != b.fan_out ? a.fan_out > b.fan_out : a.module < b.module;
                });
                break;
            case SortKey::Instability:
                std::ranges::stable_sort(metrics, [](const auto& a, const auto& b) {
                    return a.instability != b.instability ? a.instability > b.instability : a.module < b.module;
                });
                break;
        }
    }

    std::vector<CouplingMetric> compute_metrics(const DependencyGraph& graph, const SortKey key) {
        std::vector<CouplingMetric> metrics;
        metrics.reserve(graph.node_count());

        for (std::size_t i = 0; i < graph.node_count(); ++i) {
            CouplingMetric metric;
            metric.module = graph.id_at(i);
            metric.fan_in = graph.predecessor_indices(i).size();
            metric.fan_out = graph.successor_indices(i).size();

            if (const auto total = metric.fan_in + metric.fan_out; total > 0) {
                metric.instability = static_cast<double>(metric.fan_out) / static_cast<double>(total);
            }
            metrics.push_back(std::move(metric));
        }

        sort_metrics(metrics, key);
        return metrics;
    }

    double rounded_instability(const CouplingMetric& metric) noexcept {
        return std::round(metric.instability * 1000.0) / 1000.0;
    }

}  // namespace depmap::graph
