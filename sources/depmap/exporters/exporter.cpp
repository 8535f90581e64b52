//
// Created by gregorian-rayne on 1/21/26.
//

#include "depmap/exporters/exporter.hpp"
#include "depmap/utils/file_utils.hpp"
#include "depmap/utils/string_utils.hpp"
#include "depmap/version.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>

namespace depmap::exporters {

    namespace {

        const std::string SEPARATOR(70, '=');
        const std::string RULE(70, '-');

        std::string format_seconds(const double seconds) {
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(3) << seconds;
            return ss.str();
        }

        std::string format_instability(const graph::CouplingMetric& metric) {
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(3) << graph::rounded_instability(metric);
            return ss.str();
        }

        std::string tree_text(const Report& report) {
            auto text = graph::format_tree(report.tree);
            if (string_utils::trim(text).empty()) {
                return {};
            }
            return text;
        }

        std::vector<graph::CouplingMetric> metrics_by_name(const Report& report) {
            auto metrics = report.metrics;
            graph::sort_metrics(metrics, graph::SortKey::Name);
            return metrics;
        }

    }  // namespace

    // =============================================================================
    // Report
    // =============================================================================

    Report build_report(const scanner::ScanResult& scan, const ReportOptions& options) {
        Report report{scan};
        report.cycles = graph::find_cycles(scan.graph, options.max_cycle_length);
        report.metrics = graph::compute_metrics(scan.graph, options.metrics_sort);
        report.orphans = graph::find_orphans(scan.graph);
        if (auto tree = graph::render_tree(scan.graph, std::nullopt, options.tree_depth); tree.is_ok()) {
            report.tree = std::move(tree.value());
        }
        return report;
    }

    // =============================================================================
    // Helpers
    // =============================================================================

    std::string_view format_to_string(const ExportFormat format) noexcept {
        switch (format) {
        case ExportFormat::Text: return "text";
        case ExportFormat::JSON: return "json";
        case ExportFormat::Markdown: return "markdown";
        case ExportFormat::Dot: return "dot";
        }
        return "unknown";
    }

    std::optional<ExportFormat> string_to_format(const std::string_view str) noexcept {
        if (str == "text" || str == "txt") return ExportFormat::Text;
        if (str == "json" || str == "JSON") return ExportFormat::JSON;
        if (str == "markdown" || str == "md" || str == "Markdown") return ExportFormat::Markdown;
        if (str == "dot" || str == "gv" || str == "DOT") return ExportFormat::Dot;
        return std::nullopt;
    }

    std::string dot_identifier(const ModuleId& id) {
        return string_utils::replace_all(id, ".", "_");
    }

    // =============================================================================
    // IExporter
    // =============================================================================

    Result<void, Error> IExporter::export_to_file(
        const fs::path& path,
        const Report& report,
        const ExportOptions& options
    ) const {
        auto content = export_to_string(report, options);
        if (content.is_err()) {
            return Result<void, Error>::failure(content.error());
        }
        return file_utils::write_file(path, content.value());
    }

    Result<std::string, Error> IExporter::export_to_string(
        const Report& report,
        const ExportOptions& options
    ) const {
        std::ostringstream ss;
        if (auto result = export_to_stream(ss, report, options); result.is_err()) {
            return Result<std::string, Error>::failure(result.error());
        }
        return Result<std::string, Error>::success(ss.str());
    }

    // =============================================================================
    // Exporter Factory
    // =============================================================================

    Result<std::unique_ptr<IExporter>, Error> ExporterFactory::create(const ExportFormat format) {
        switch (format) {
        case ExportFormat::Text:
            return Result<std::unique_ptr<IExporter>, Error>::success(
                std::make_unique<TextExporter>()
            );
        case ExportFormat::JSON:
            return Result<std::unique_ptr<IExporter>, Error>::success(
                std::make_unique<JsonExporter>()
            );
        case ExportFormat::Markdown:
            return Result<std::unique_ptr<IExporter>, Error>::success(
                std::make_unique<MarkdownExporter>()
            );
        case ExportFormat::Dot:
            return Result<std::unique_ptr<IExporter>, Error>::success(
                std::make_unique<DotExporter>()
            );
        }
        return Result<std::unique_ptr<IExporter>, Error>::failure(
            Error::invalid_argument("Unsupported export format")
        );
    }

    Result<std::unique_ptr<IExporter>, Error> ExporterFactory::create_for_file(const fs::path& path) {
        std::string ext = path.extension().string();
        std::ranges::transform(ext, ext.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (ext == ".txt") return create(ExportFormat::Text);
        if (ext == ".json") return create(ExportFormat::JSON);
        if (ext == ".md" || ext == ".markdown") return create(ExportFormat::Markdown);
        if (ext == ".dot" || ext == ".gv") return create(ExportFormat::Dot);

        return Result<std::unique_ptr<IExporter>, Error>::failure(
            Error::invalid_argument("Cannot determine format from extension", ext)
        );
    }

    std::vector<ExportFormat> ExporterFactory::available_formats() {
        return {
            ExportFormat::Text,
            ExportFormat::JSON,
            ExportFormat::Markdown,
            ExportFormat::Dot
        };
    }

    // =============================================================================
    // Text Exporter
    // =============================================================================

    Result<void, Error> TextExporter::export_to_stream(
        std::ostream& stream,
        const Report& report,
        const ExportOptions&
    ) const {
        const auto& scan = report.scan;

        stream << SEPARATOR << "\n";
        stream << "DEPMAP - DEPENDENCY ANALYSIS REPORT\n";
        stream << SEPARATOR << "\n";
        stream << "Project: " << scan.root.string() << "\n";
        stream << "Scanned: " << scan.stats.files_seen << " Python files\n";
        stream << "Parse errors: " << scan.stats.parse_errors << "\n";
        stream << "Scan time: " << format_seconds(scan.stats.elapsed_seconds()) << "s\n";
        stream << "Modules: " << scan.modules.size() << "\n";
        stream << "Dependencies: " << scan.graph.edge_count() << "\n";
        stream << "\n";

        stream << SEPARATOR << "\n";
        stream << "DEPENDENCY TREE\n";
        stream << RULE << "\n";
        if (const auto tree = tree_text(report); !tree.empty()) {
            stream << tree << "\n";
        } else {
            stream << "(no local dependencies found)\n";
        }
        stream << "\n";

        stream << SEPARATOR << "\n";
        stream << "CIRCULAR IMPORTS\n";
        stream << RULE << "\n";
        if (!report.cycles.empty()) {
            stream << "[!] Found " << report.cycles.size() << " circular import chain(s):\n\n";
            for (std::size_t i = 0; i < report.cycles.size(); ++i) {
                stream << "  Cycle " << (i + 1) << ": " << report.cycles[i].to_string() << "\n";
            }
        } else {
            stream << "[OK] No circular imports detected!\n";
        }
        stream << "\n";

        stream << SEPARATOR << "\n";
        stream << "COUPLING METRICS\n";
        stream << RULE << "\n";
        if (!report.metrics.empty()) {
            stream << std::left << std::setw(40) << "Module" << " "
                   << std::right << std::setw(7) << "Fan-In" << " "
                   << std::setw(8) << "Fan-Out" << " "
                   << std::setw(8) << "Instab." << "\n";
            stream << RULE << "\n";
            for (const auto& m : report.metrics) {
                stream << std::left << std::setw(40) << m.module << " "
                       << std::right << std::setw(7) << m.fan_in << " "
                       << std::setw(8) << m.fan_out << " "
                       << std::setw(8) << format_instability(m) << "\n";
            }
        } else {
            stream << "(no modules to analyze)\n";
        }
        stream << "\n";

        stream << SEPARATOR << "\n";
        stream << "ORPHAN MODULES (no inbound imports)\n";
        stream << RULE << "\n";
        if (!report.orphans.empty()) {
            for (const auto& orphan : report.orphans) {
                stream << "  " << orphan.module << " (" << graph::to_string(orphan.kind) << ")\n";
            }
        } else {
            stream << "(all modules are imported by at least one other)\n";
        }
        stream << "\n";

        if (scan.stats.parse_errors > 0) {
            stream << SEPARATOR << "\n";
            stream << "PARSE ERRORS\n";
            stream << RULE << "\n";
            for (const auto* module : scan.parse_failures()) {
                stream << "  " << module->id << ": " << *module->parse_error << "\n";
            }
            stream << "\n";
        }

        stream << SEPARATOR << "\n";
        stream << "Report generated by " << PROJECT_NAME << " v" << VERSION_STRING << "\n";
        stream << SEPARATOR << "\n";

        if (!stream) {
            return Result<void, Error>::failure(Error::io_error("Failed to write report", "text"));
        }
        return Result<void, Error>::success();
    }

    // =============================================================================
    // JSON Exporter
    // =============================================================================

    Result<void, Error> JsonExporter::export_to_stream(
        std::ostream& stream,
        const Report& report,
        const ExportOptions& options
    ) const {
        using json = nlohmann::json;
        const auto& scan = report.scan;

        json output;
        output["depmap_version"] = VERSION_STRING;
        output["project"] = scan.root.string();

        output["summary"] = {
            {"total_files", scan.stats.files_seen},
            {"total_modules", scan.modules.size()},
            {"total_dependencies", scan.graph.edge_count()},
            {"parse_errors", scan.stats.parse_errors},
            {"shadowed_files", scan.stats.shadowed_files},
            {"scan_time_seconds", std::round(scan.stats.elapsed_seconds() * 1000.0) / 1000.0},
            {"circular_import_count", report.cycles.size()},
            {"orphan_count", report.orphans.size()}
        };

        json modules = json::object();
        for (const auto& module : scan.modules) {
            json entry;
            entry["filepath"] = module.path.string();
            entry["line_count"] = module.line_count;
            entry["is_package"] = module.is_package;
            entry["import_count"] = module.import_count;
            entry["parse_error"] = module.parse_error ? json(*module.parse_error) : json(nullptr);

            if (const auto it = scan.imports.find(module.id); it != scan.imports.end()) {
                const auto& breakdown = it->second;
                entry["imports"] = {
                    {"local", breakdown.local},
                    {"stdlib", breakdown.standard_library},
                    {"third_party", breakdown.third_party},
                    {"relative", breakdown.relative},
                    {"unresolved", breakdown.unresolved}
                };
            }
            modules[module.id] = std::move(entry);
        }
        output["modules"] = std::move(modules);

        json dependencies = json::object();
        for (const auto& id : scan.graph.nodes()) {
            if (auto targets = scan.graph.successors(id); !targets.empty()) {
                dependencies[id] = std::move(targets);
            }
        }
        output["dependencies"] = std::move(dependencies);

        json cycles = json::array();
        for (const auto& cycle : report.cycles) {
            cycles.push_back(json{{"cycle", cycle.nodes}, {"length", cycle.length()}});
        }
        output["circular_imports"] = std::move(cycles);

        json metrics = json::array();
        for (const auto& m : metrics_by_name(report)) {
            metrics.push_back(json{
                {"module", m.module},
                {"fan_in", m.fan_in},
                {"fan_out", m.fan_out},
                {"instability", graph::rounded_instability(m)}
            });
        }
        output["coupling_metrics"] = std::move(metrics);

        json orphans = json::array();
        for (const auto& orphan : report.orphans) {
            orphans.push_back(orphan.module);
        }
        output["orphans"] = std::move(orphans);

        // Non-UTF-8 bytes from source files are written as U+FFFD
        stream << output.dump(options.pretty_print ? 2 : -1, ' ', false, json::error_handler_t::replace) << std::endl;

        if (!stream) {
            return Result<void, Error>::failure(Error::io_error("Failed to write report", "json"));
        }
        return Result<void, Error>::success();
    }

    // =============================================================================
    // Markdown Exporter
    // =============================================================================

    Result<void, Error> MarkdownExporter::export_to_stream(
        std::ostream& stream,
        const Report& report,
        const ExportOptions&
    ) const {
        const auto& scan = report.scan;
        const auto edges = scan.graph.edge_count();

        stream << "# DepMap - Dependency Analysis Report\n\n";
        stream << "**Project:** `" << scan.root.string() << "`  \n";
        stream << "**Files Scanned:** " << scan.stats.files_seen << "  \n";
        stream << "**Modules Found:** " << scan.modules.size() << "  \n";
        stream << "**Dependencies:** " << edges << "  \n";
        stream << "**Parse Errors:** " << scan.stats.parse_errors << "  \n";
        stream << "**Scan Time:** " << format_seconds(scan.stats.elapsed_seconds()) << "s  \n\n";

        stream << "## Summary\n\n";
        stream << "| Metric | Value |\n";
        stream << "|--------|-------|\n";
        stream << "| Python Files | " << scan.stats.files_seen << " |\n";
        stream << "| Local Modules | " << scan.modules.size() << " |\n";
        stream << "| Dependencies | " << edges << " |\n";
        stream << "| Circular Imports | " << report.cycles.size() << " "
               << (report.cycles.empty() ? "[OK]" : "[!] FOUND") << " |\n";
        stream << "| Orphan Modules | " << report.orphans.size() << " |\n";
        stream << "| Parse Errors | " << scan.stats.parse_errors << " |\n\n";

        stream << "## Dependency Tree\n\n";
        stream << "```\n";
        if (const auto tree = tree_text(report); !tree.empty()) {
            stream << tree << "\n";
        } else {
            stream << "(no local dependencies)\n";
        }
        stream << "```\n\n";

        stream << "## Circular Imports\n\n";
        if (!report.cycles.empty()) {
            stream << "**[!] " << report.cycles.size() << " circular import chain(s) detected:**\n\n";
            for (std::size_t i = 0; i < report.cycles.size(); ++i) {
                stream << (i + 1) << ". `" << report.cycles[i].to_string() << "`\n";
            }
        } else {
            stream << "**[OK] No circular imports detected!**\n";
        }
        stream << "\n";

        stream << "## Coupling Metrics\n\n";
        if (!report.metrics.empty()) {
            stream << "| Module | Fan-In | Fan-Out | Instability |\n";
            stream << "|--------|--------|---------|-------------|\n";
            for (const auto& m : report.metrics) {
                stream << "| " << m.module << " | " << m.fan_in << " | " << m.fan_out
                       << " | " << format_instability(m) << " |\n";
            }
        } else {
            stream << "(no modules to analyze)\n";
        }
        stream << "\n";

        stream << "## Orphan Modules\n\n";
        if (!report.orphans.empty()) {
            stream << "These modules are not imported by any other local module:\n\n";
            for (const auto& orphan : report.orphans) {
                stream << "- `" << orphan.module << "` ("
                       << (orphan.kind == graph::OrphanKind::EntryPoint ? "entry point" : "standalone / dead code")
                       << ")\n";
            }
        } else {
            stream << "All modules are imported by at least one other.\n";
        }
        stream << "\n";

        if (scan.stats.parse_errors > 0) {
            stream << "## Parse Errors\n\n";
            stream << "| Module | Error |\n";
            stream << "|--------|-------|\n";
            for (const auto* module : scan.parse_failures()) {
                stream << "| " << module->id << " | " << *module->parse_error << " |\n";
            }
            stream << "\n";
        }

        stream << "---\n";
        stream << "*Generated by " << PROJECT_NAME << " v" << VERSION_STRING << "*\n";

        if (!stream) {
            return Result<void, Error>::failure(Error::io_error("Failed to write report", "markdown"));
        }
        return Result<void, Error>::success();
    }

    // =============================================================================
    // DOT Exporter
    // =============================================================================

    Result<void, Error> DotExporter::export_to_stream(
        std::ostream& stream,
        const Report& report,
        const ExportOptions& options
    ) const {
        const auto& scan = report.scan;

        std::set<std::pair<ModuleId, ModuleId>> highlighted;
        if (options.highlight_cycles) {
            highlighted = graph::cycle_edges(report.cycles);
        }

        stream << "digraph dependencies {\n";
        stream << "    rankdir=LR;\n";
        stream << "    node [shape=box, style=filled, fillcolor=\"#e8f4fd\", fontname=\"Arial\"];\n";
        stream << "    edge [fontname=\"Arial\", fontsize=10];\n";
        stream << "\n";

        for (const auto& module : scan.modules) {
            const auto label = string_utils::replace_all(module.id, ".", "\\n");
            stream << "    \"" << dot_identifier(module.id) << "\" [label=\"" << label << "\"";
            if (module.is_package) {
                stream << ", fillcolor=\"#d4edda\"";
            }
            stream << "];\n";
        }

        stream << "\n";

        for (const auto& edge : scan.graph.edges()) {
            stream << "    \"" << dot_identifier(edge.from) << "\" -> \"" << dot_identifier(edge.to) << "\"";
            if (highlighted.contains({edge.from, edge.to})) {
                stream << " [color=\"red\", penwidth=2.0]";
            }
            stream << ";\n";
        }

        stream << "}\n";

        if (!stream) {
            return Result<void, Error>::failure(Error::io_error("Failed to write graph", "dot"));
        }
        return Result<void, Error>::success();
    }

}  // namespace depmap::exporters
