//
// Created by gregorian-rayne on 1/22/26.
//

#include "depmap/cli/formatter.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace depmap::cli
{
    // ============================================================================
    // Colors
    // ============================================================================

    namespace colors {

        namespace {
            bool g_colors_enabled = true;
        }

        bool enabled() {
            return g_colors_enabled && is_tty();
        }

        void set_enabled(const bool enable) {
            g_colors_enabled = enable;
        }

    }  // namespace colors

    bool is_tty() {
        return isatty(fileno(stdout)) != 0;
    }

    // ============================================================================
    // Formatting Functions
    // ============================================================================

    std::string colorize(const std::string& text, const char* color) {
        if (!colors::enabled()) {
            return text;
        }
        return std::string(color) + text + colors::RESET;
    }

    std::string format_seconds(const double seconds) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(3) << seconds << "s";
        return ss.str();
    }

    std::string instability_marker(const graph::CouplingMetric& metric) {
        const double instability = graph::rounded_instability(metric);
        if (instability >= 0.8) {
            return " [!]";
        }
        if (instability <= 0.2 && metric.fan_in > 0) {
            return " [stable]";
        }
        return "";
    }

    // ============================================================================
    // Table Implementation
    // ============================================================================

    namespace {

        std::string fit_cell(std::string cell, const std::size_t width, const bool right_align) {
            if (cell.size() > width && width > 3) {
                cell.resize(width - 3);
                cell += "...";
            }
            if (cell.size() >= width) {
                return cell;
            }
            const std::string fill(width - cell.size(), ' ');
            return right_align ? fill + cell : cell + fill;
        }

        std::string rule(const std::vector<std::size_t>& widths) {
            std::string line;
            for (std::size_t i = 0; i < widths.size(); ++i) {
                if (i > 0) {
                    line += "--";
                }
                line.append(widths[i], '-');
            }
            return line;
        }

    }  // namespace

    Table::Table(std::vector<Column> columns)
        : columns_(std::move(columns))
    {}

    void Table::add_row(Row row) {
        row.resize(std::max(row.size(), columns_.size()));
        lines_.push_back(Line{std::move(row)});
    }

    void Table::add_separator() {
        if (!lines_.empty()) {
            lines_.back().rule_after = true;
        }
    }

    std::vector<std::size_t> Table::column_widths() const {
        std::vector<std::size_t> widths;
        widths.reserve(columns_.size());
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            std::size_t width = columns_[i].width;
            if (width == 0) {
                width = columns_[i].header.size();
                for (const auto& line : lines_) {
                    width = std::max(width, line.cells[i].size());
                }
            }
            widths.push_back(width);
        }
        return widths;
    }

    std::string Table::render() const {
        std::ostringstream ss;
        render(ss);
        return ss.str();
    }

    void Table::render(std::ostream& out) const {
        const auto widths = column_widths();

        const auto format_row = [&](const Row& cells) {
            std::string text;
            for (std::size_t i = 0; i < columns_.size(); ++i) {
                if (i > 0) {
                    text += "  ";
                }
                text += fit_cell(cells[i], widths[i], columns_[i].right_align);
            }
            text.erase(text.find_last_not_of(' ') + 1);
            return text;
        };

        if (show_headers_) {
            Row headers;
            for (const auto& column : columns_) {
                headers.push_back(column.header);
            }
            out << colorize(format_row(headers), colors::BOLD) << "\n";
            out << rule(widths) << "\n";
        }

        for (const auto& line : lines_) {
            out << format_row(line.cells) << "\n";
            if (line.rule_after) {
                out << rule(widths) << "\n";
            }
        }
    }

    // ============================================================================
    // SummaryPrinter Implementation
    // ============================================================================

    SummaryPrinter::SummaryPrinter(std::ostream& out)
        : out_(out)
    {}

    void SummaryPrinter::print_scan_summary(const scanner::ScanResult& scan) const {
        out_ << colorize("[OK]", colors::GREEN) << " Scan complete: " << scan.root.string() << "\n";
        out_ << "     Files: " << scan.stats.files_seen
             << " | Modules: " << scan.modules.size()
             << " | Dependencies: " << scan.graph.edge_count()
             << " | Time: " << format_seconds(scan.stats.elapsed_seconds()) << "\n";

        if (scan.stats.parse_errors > 0) {
            out_ << "     " << colorize("[!]", colors::YELLOW) << " "
                 << scan.stats.parse_errors << " file(s) had parse errors\n";
        }
    }

    void SummaryPrinter::print_tree(const graph::DependencyTree& tree) const {
        out_ << colorize("DEPENDENCY TREE", colors::BOLD) << "\n";
        out_ << std::string(50, '-') << "\n";

        if (tree.empty()) {
            out_ << "(no local dependencies found)\n";
            return;
        }
        out_ << graph::format_tree(tree) << "\n";
    }

    void SummaryPrinter::print_cycles(const std::vector<graph::Cycle>& cycles) const {
        if (cycles.empty()) {
            out_ << colorize("[OK]", colors::GREEN) << " No circular imports detected!\n";
            return;
        }

        out_ << colorize("[!]", colors::RED) << " Found " << cycles.size()
             << " circular import chain(s):\n\n";
        for (std::size_t i = 0; i < cycles.size(); ++i) {
            out_ << "  Cycle " << (i + 1) << ": " << cycles[i].to_string() << "\n";
        }
    }

    void SummaryPrinter::print_metrics(const std::vector<graph::CouplingMetric>& metrics) const {
        out_ << colorize("COUPLING METRICS", colors::BOLD) << "\n";
        out_ << std::string(70, '-') << "\n";

        Table table({
            {"Module", 0, false},
            {"Fan-In", 7, true},
            {"Fan-Out", 8, true},
            {"Instab.", 8, true},
            {"", 0, false}
        });

        for (const auto& metric : metrics) {
            std::ostringstream instability;
            instability << std::fixed << std::setprecision(3) << graph::rounded_instability(metric);

            const std::string marker = instability_marker(metric);
            table.add_row({
                metric.module,
                std::to_string(metric.fan_in),
                std::to_string(metric.fan_out),
                instability.str(),
                marker.empty() ? marker : colorize(marker.substr(1), marker == " [!]" ? colors::RED : colors::GREEN)
            });
        }

        table.render(out_);
    }

    void SummaryPrinter::print_orphans(const std::vector<graph::Orphan>& orphans) const {
        if (orphans.empty()) {
            out_ << colorize("[OK]", colors::GREEN)
                 << " All modules are imported by at least one other module.\n";
            return;
        }

        out_ << colorize("ORPHAN MODULES", colors::BOLD) << " (" << orphans.size() << " found)\n";
        out_ << std::string(50, '-') << "\n";
        for (const auto& orphan : orphans) {
            out_ << "  " << orphan.module << " (" << graph::to_string(orphan.kind) << ")\n";
        }
    }

}  // namespace depmap::cli
