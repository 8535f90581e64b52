//
// Created by gregorian-rayne on 1/22/26.
//

#ifndef DEPMAP_FORMATTER_HPP
#define DEPMAP_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Output formatting utilities for CLI.
 *
 * Provides consistent formatting for:
 * - Tables
 * - Scan summaries and analysis sections
 * - Colors and styles
 */

#include "depmap/types.hpp"
#include "depmap/scanner/scanner.hpp"
#include "depmap/graph/coupling.hpp"
#include "depmap/graph/cycles.hpp"
#include "depmap/graph/tree.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace depmap::cli
{
    /**
     * Terminal color codes.
     */
    namespace colors {

        inline constexpr const char* RESET = "\033[0m";
        inline constexpr const char* BOLD = "\033[1m";
        inline constexpr const char* RED = "\033[31m";
        inline constexpr const char* GREEN = "\033[32m";
        inline constexpr const char* YELLOW = "\033[33m";

        /**
         * Returns true if colors should be used.
         */
        bool enabled();

        /**
         * Enable/disable colors globally.
         */
        void set_enabled(bool enable);

    }  // namespace colors

    /**
     * True when stdout is a terminal.
     */
    [[nodiscard]] bool is_tty();

    /**
     * Wraps text in a color when colors are enabled.
     */
    [[nodiscard]] std::string colorize(const std::string& text, const char* color);

    /**
     * Seconds with millisecond precision ("0.042s").
     */
    [[nodiscard]] std::string format_seconds(double seconds);

    /**
     * Marker appended to a metrics row: " [!]" for unstable modules,
     * " [stable]" for imported modules with low instability.
     */
    [[nodiscard]] std::string instability_marker(const graph::CouplingMetric& metric);

    struct Column {
        std::string header;
        std::size_t width = 0;    // 0 sizes the column to its widest cell
        bool right_align = false;
    };

    using Row = std::vector<std::string>;

    /**
     * Column-aligned text table. Columns are joined by two spaces and
     * trailing padding is dropped; cells wider than a fixed width are
     * cut and end in "...".
     */
    class Table {
    public:
        explicit Table(std::vector<Column> columns);

        void add_row(Row row);

        /**
         * Draws a rule under the last added row.
         */
        void add_separator();

        [[nodiscard]] std::string render() const;

        void render(std::ostream& out) const;

        void set_show_headers(bool show) { show_headers_ = show; }

    private:
        struct Line {
            Row cells;
            bool rule_after = false;
        };

        [[nodiscard]] std::vector<std::size_t> column_widths() const;

        std::vector<Column> columns_;
        std::vector<Line> lines_;
        bool show_headers_ = true;
    };

    /**
     * Prints the sections shared by the analysis commands.
     */
    class SummaryPrinter {
    public:
        explicit SummaryPrinter(std::ostream& out);

        /**
         * "[OK] Scan complete" line with file, module, dependency and
         * timing counts, plus a parse-error line when any file failed.
         */
        void print_scan_summary(const scanner::ScanResult& scan) const;

        void print_tree(const graph::DependencyTree& tree) const;

        void print_cycles(const std::vector<graph::Cycle>& cycles) const;

        void print_metrics(const std::vector<graph::CouplingMetric>& metrics) const;

        void print_orphans(const std::vector<graph::Orphan>& orphans) const;

    private:
        std::ostream& out_;
    };

}  // namespace depmap::cli

#endif //DEPMAP_FORMATTER_HPP
