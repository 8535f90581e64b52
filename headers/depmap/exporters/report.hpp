//
// Created by gregorian-rayne on 1/21/26.
//

#ifndef DEPMAP_REPORT_HPP
#define DEPMAP_REPORT_HPP

/**
 * @file report.hpp
 * @brief Analysis results gathered for one scan, ready for export.
 */

#include "depmap/scanner/scanner.hpp"
#include "depmap/graph/coupling.hpp"
#include "depmap/graph/cycles.hpp"
#include "depmap/graph/tree.hpp"

#include <vector>

namespace depmap::exporters {

    struct ReportOptions {
        std::size_t max_cycle_length = graph::DEFAULT_MAX_CYCLE_LENGTH;
        std::size_t tree_depth = graph::DEFAULT_TREE_DEPTH;
        graph::SortKey metrics_sort = graph::SortKey::Instability;
    };

    /**
     * Every analysis of a scan. Refers to the ScanResult, which must
     * outlive it.
     */
    struct Report {
        const scanner::ScanResult& scan;
        std::vector<graph::Cycle> cycles;
        std::vector<graph::CouplingMetric> metrics;
        std::vector<graph::Orphan> orphans;
        graph::DependencyTree tree;
    };

    [[nodiscard]] Report build_report(const scanner::ScanResult& scan, const ReportOptions& options = {});

}  // namespace depmap::exporters

#endif //DEPMAP_REPORT_HPP
