//
// Created by gregorian-rayne on 1/19/26.
//

#ifndef DEPMAP_SCANNER_HPP
#define DEPMAP_SCANNER_HPP

/**
 * @file scanner.hpp
 * @brief One full scan: discovery, extraction, resolution, graph build.
 *
 * scan() returns a self-contained, immutable ScanResult. Every analysis
 * (cycles, metrics, orphans, tree, reports) takes that value explicitly;
 * nothing keeps "the last scan" around.
 *
 * @code
 *     auto scanned = depmap::scanner::scan("src/");
 *     if (scanned.is_ok()) {
 *         auto cycles = depmap::graph::find_cycles(scanned.value().graph);
 *     }
 * @endcode
 */

#include "depmap/result.hpp"
#include "depmap/error.hpp"
#include "depmap/types.hpp"
#include "depmap/graph/graph.hpp"

#include <map>
#include <string>
#include <vector>

namespace depmap::scanner {

    struct ScanOptions {
        /// Directory names or root-relative paths to skip.
        std::vector<std::string> exclude;
        /// Also skip default_excludes().
        bool use_default_excludes = true;
        /// Added to the standard-library classification table.
        std::vector<std::string> extra_stdlib_modules;
        /// Extraction workers (0 = hardware concurrency, 1 = inline).
        unsigned int threads = 0;
    };

    /**
     * A module's imports grouped by classification. Every list is sorted
     * and free of duplicates.
     *
     * - local: resolved module ids
     * - standard_library / third_party: top-level names ("os", "requests")
     * - relative: relative spellings (".utils", "..core")
     * - unresolved: spellings that named nothing resolvable
     */
    struct ImportBreakdown {
        std::vector<std::string> local;
        std::vector<std::string> standard_library;
        std::vector<std::string> third_party;
        std::vector<std::string> relative;
        std::vector<std::string> unresolved;
    };

    struct ScanResult {
        fs::path root;
        std::string project_name;
        graph::DependencyGraph graph;
        std::vector<Module> modules;                        ///< sorted by id
        std::map<ModuleId, ImportBreakdown> imports;
        ScanStats stats;

        [[nodiscard]] const Module* find_module(const ModuleId& id) const;

        /**
         * Modules whose source could not be read or parsed, by id.
         */
        [[nodiscard]] std::vector<const Module*> parse_failures() const;
    };

    /**
     * Scans a directory tree, or a single source file as a one-module
     * project.
     *
     * Per-file read and parse failures are recorded on the module and
     * counted in ScanStats; they never abort the scan.
     *
     * @return PathNotFound when root does not exist, InvalidArgument when
     *         root is a file no extractor handles.
     */
    [[nodiscard]] Result<ScanResult, Error> scan(
        const fs::path& root,
        const ScanOptions& options = {}
    );

}  // namespace depmap::scanner

#endif //DEPMAP_SCANNER_HPP
