//
// Created by gregorian-rayne on 1/23/26.
//

#include <gtest/gtest.h>
#include <sstream>
#include <filesystem>

#include <nlohmann/json.hpp>

#include "depmap/exporters/exporter.hpp"
#include "depmap/scanner/scanner.hpp"
#include "depmap/utils/file_utils.hpp"

namespace depmap::exporters::test
{
    namespace fs = std::filesystem;
    using json = nlohmann::json;

    /**
     * A small scan: main -> app.service <-> app.models, plus an
     * isolated module with a parse error.
     */
    scanner::ScanResult create_sample_scan() {
        scanner::ScanResult scan;
        scan.root = "/projects/shop";
        scan.project_name = "shop";

        graph::GraphBuilder builder;
        builder.add_edge("main", "app.service");
        builder.add_edge("app.service", "app.models");
        builder.add_edge("app.models", "app.service");
        builder.add_node("app");
        builder.add_node("legacy");
        scan.graph = builder.build();

        for (const auto& id : scan.graph.nodes()) {
            Module module;
            module.id = id;
            module.path = scan.root / (id + ".py");
            module.is_package = id == "app";
            module.line_count = 10;
            if (id == "legacy") {
                module.parse_error = "Unterminated string at line 3";
            }
            scan.modules.push_back(module);
        }

        scanner::ImportBreakdown main_imports;
        main_imports.local = {"app.service"};
        main_imports.standard_library = {"os"};
        main_imports.third_party = {"requests"};
        scan.imports["main"] = main_imports;

        scan.stats.files_seen = 5;
        scan.stats.parse_errors = 1;
        return scan;
    }

    class ExporterTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir = fs::temp_directory_path() / "depmap_exporter_test";
            fs::remove_all(temp_dir);
            fs::create_directories(temp_dir);
        }

        void TearDown() override {
            if (fs::exists(temp_dir)) {
                fs::remove_all(temp_dir);
            }
        }

        static std::string export_with(const IExporter& exporter, const Report& report,
                                       const ExportOptions& options = {}) {
            auto content = exporter.export_to_string(report, options);
            EXPECT_TRUE(content.is_ok());
            return content.is_ok() ? content.value() : "";
        }

        fs::path temp_dir;
        scanner::ScanResult scan = create_sample_scan();
        Report report = build_report(scan);
    };

    TEST_F(ExporterTest, BuildReportRunsEveryAnalysis) {
        ASSERT_EQ(report.cycles.size(), 1u);
        EXPECT_EQ(report.cycles[0].to_string(), "app.models -> app.service -> app.models");
        EXPECT_EQ(report.metrics.size(), 5u);
        ASSERT_EQ(report.orphans.size(), 3u);
        EXPECT_EQ(report.orphans[0].module, "app");
        EXPECT_FALSE(report.tree.empty());
    }

    TEST_F(ExporterTest, FactoryCreatesEveryFormat) {
        for (const auto format : ExporterFactory::available_formats()) {
            auto exporter = ExporterFactory::create(format);
            ASSERT_TRUE(exporter.is_ok());
            EXPECT_EQ(exporter.value()->format(), format);
        }
    }

    TEST_F(ExporterTest, FactoryInfersFormatFromExtension) {
        EXPECT_EQ(ExporterFactory::create_for_file("out.json").value()->format(), ExportFormat::JSON);
        EXPECT_EQ(ExporterFactory::create_for_file("OUT.MD").value()->format(), ExportFormat::Markdown);
        EXPECT_EQ(ExporterFactory::create_for_file("deps.gv").value()->format(), ExportFormat::Dot);
        EXPECT_EQ(ExporterFactory::create_for_file("report.txt").value()->format(), ExportFormat::Text);
        EXPECT_TRUE(ExporterFactory::create_for_file("report.pdf").is_err());
    }

    TEST_F(ExporterTest, FormatNames) {
        EXPECT_EQ(format_to_string(ExportFormat::Markdown), "markdown");
        EXPECT_EQ(string_to_format("md"), ExportFormat::Markdown);
        EXPECT_EQ(string_to_format("gv"), ExportFormat::Dot);
        EXPECT_FALSE(string_to_format("xml").has_value());
    }

    TEST_F(ExporterTest, TextReport) {
        const auto text = export_with(TextExporter(), report);

        EXPECT_NE(text.find("DEPMAP - DEPENDENCY ANALYSIS REPORT"), std::string::npos);
        EXPECT_NE(text.find("Scanned: 5 Python files"), std::string::npos);
        EXPECT_NE(text.find("Cycle 1: app.models -> app.service -> app.models"), std::string::npos);
        EXPECT_NE(text.find("legacy (standalone / potential dead code)"), std::string::npos);
        EXPECT_NE(text.find("main (entry point / orchestrator)"), std::string::npos);
        EXPECT_NE(text.find("PARSE ERRORS"), std::string::npos);
        EXPECT_NE(text.find("legacy: Unterminated string at line 3"), std::string::npos);
    }

    TEST_F(ExporterTest, JsonReport) {
        const auto output = json::parse(export_with(JsonExporter(), report));

        EXPECT_EQ(output["summary"]["total_files"], 5);
        EXPECT_EQ(output["summary"]["total_modules"], 5);
        EXPECT_EQ(output["summary"]["total_dependencies"], 3);
        EXPECT_EQ(output["summary"]["circular_import_count"], 1);
        EXPECT_EQ(output["summary"]["orphan_count"], 3);

        EXPECT_EQ(output["dependencies"]["main"], json::array({"app.service"}));
        EXPECT_FALSE(output["dependencies"].contains("legacy"));

        const auto& main = output["modules"]["main"];
        EXPECT_EQ(main["imports"]["stdlib"], json::array({"os"}));
        EXPECT_EQ(main["imports"]["third_party"], json::array({"requests"}));
        EXPECT_TRUE(main["parse_error"].is_null());
        EXPECT_TRUE(output["modules"]["app"]["is_package"].get<bool>());
        EXPECT_EQ(output["modules"]["legacy"]["parse_error"], "Unterminated string at line 3");

        ASSERT_EQ(output["circular_imports"].size(), 1u);
        EXPECT_EQ(output["circular_imports"][0]["length"], 2);

        const auto& metrics = output["coupling_metrics"];
        ASSERT_EQ(metrics.size(), 5u);
        EXPECT_EQ(metrics[0]["module"], "app");
        EXPECT_EQ(metrics[4]["module"], "main");
        EXPECT_DOUBLE_EQ(metrics[4]["instability"].get<double>(), 1.0);
    }

    TEST_F(ExporterTest, CompactJson) {
        ExportOptions options;
        options.pretty_print = false;

        const auto compact = export_with(JsonExporter(), report, options);
        EXPECT_EQ(compact.find("\n  "), std::string::npos);
        EXPECT_NO_THROW((void)json::parse(compact));
    }

    TEST_F(ExporterTest, JsonReplacesInvalidUtf8) {
        const auto source = temp_dir / "latin.py";
        ASSERT_TRUE(file_utils::write_file(source, "# -*- coding: latin-1 -*-\nimport caf\xe9\n").is_ok());

        auto scanned = scanner::scan(source);
        ASSERT_TRUE(scanned.is_ok());
        const auto latin_report = build_report(scanned.value());

        std::ostringstream out;
        ASSERT_TRUE(JsonExporter().export_to_stream(out, latin_report, {}).is_ok());

        const auto output = json::parse(out.str());
        EXPECT_EQ(output["modules"]["latin"]["imports"]["third_party"],
                  json::array({"caf\xef\xbf\xbd"}));
    }

    TEST_F(ExporterTest, MarkdownReport) {
        const auto markdown = export_with(MarkdownExporter(), report);

        EXPECT_NE(markdown.find("# DepMap - Dependency Analysis Report"), std::string::npos);
        EXPECT_NE(markdown.find("| Circular Imports | 1 [!] FOUND |"), std::string::npos);
        EXPECT_NE(markdown.find("1. `app.models -> app.service -> app.models`"), std::string::npos);
        EXPECT_NE(markdown.find("- `main` (entry point)"), std::string::npos);
        EXPECT_NE(markdown.find("## Parse Errors"), std::string::npos);
    }

    TEST_F(ExporterTest, DotGraph) {
        const auto dot = export_with(DotExporter(), report);

        EXPECT_EQ(dot.rfind("digraph dependencies {", 0), 0u);
        EXPECT_NE(dot.find("\"app_service\" [label=\"app\\nservice\"];"), std::string::npos);
        EXPECT_NE(dot.find("\"app\" [label=\"app\", fillcolor=\"#d4edda\"];"), std::string::npos);
        EXPECT_NE(dot.find("\"main\" -> \"app_service\";"), std::string::npos);
        EXPECT_NE(dot.find("\"app_models\" -> \"app_service\" [color=\"red\", penwidth=2.0];"), std::string::npos);
    }

    TEST_F(ExporterTest, DotGraphWithoutHighlight) {
        ExportOptions options;
        options.highlight_cycles = false;

        EXPECT_EQ(export_with(DotExporter(), report, options).find("color=\"red\""), std::string::npos);
    }

    TEST_F(ExporterTest, DotIdentifier) {
        EXPECT_EQ(dot_identifier("a.b.c"), "a_b_c");
        EXPECT_EQ(dot_identifier("flat"), "flat");
    }

    TEST_F(ExporterTest, ExportToFileCreatesParents) {
        const auto path = temp_dir / "nested" / "report.md";

        ASSERT_TRUE(MarkdownExporter().export_to_file(path, report, {}).is_ok());

        const auto content = file_utils::read_file(path);
        ASSERT_TRUE(content.is_ok());
        EXPECT_NE(content.value().find("## Coupling Metrics"), std::string::npos);
    }

    TEST_F(ExporterTest, EmptyProject) {
        const scanner::ScanResult empty;
        const auto empty_report = build_report(empty);

        const auto text = export_with(TextExporter(), empty_report);
        EXPECT_NE(text.find("(no local dependencies found)"), std::string::npos);
        EXPECT_NE(text.find("[OK] No circular imports detected!"), std::string::npos);
        EXPECT_NE(text.find("(no modules to analyze)"), std::string::npos);
    }
}  // namespace depmap::exporters::test
