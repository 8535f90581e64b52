//
// Created by gregorian-rayne on 1/23/26.
//

#include "depmap/cli/formatter.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace depmap::cli
{
    class FormatterTest : public ::testing::Test {
    protected:
        void SetUp() override {
            colors::set_enabled(false);
        }

        void TearDown() override {
            colors::set_enabled(true);
        }

        static graph::CouplingMetric metric(const std::string& module, const std::size_t fan_in,
                                            const std::size_t fan_out) {
            graph::CouplingMetric m;
            m.module = module;
            m.fan_in = fan_in;
            m.fan_out = fan_out;
            if (fan_in + fan_out > 0) {
                m.instability = static_cast<double>(fan_out) / static_cast<double>(fan_in + fan_out);
            }
            return m;
        }

        std::ostringstream out;
    };

    TEST_F(FormatterTest, ColorizeWithoutColors) {
        EXPECT_EQ(colorize("[OK]", colors::GREEN), "[OK]");
    }

    TEST_F(FormatterTest, FormatSeconds) {
        EXPECT_EQ(format_seconds(0.0), "0.000s");
        EXPECT_EQ(format_seconds(1.23456), "1.235s");
    }

    TEST_F(FormatterTest, InstabilityMarkers) {
        EXPECT_EQ(instability_marker(metric("a", 0, 4)), " [!]");
        EXPECT_EQ(instability_marker(metric("b", 1, 4)), " [!]");
        EXPECT_EQ(instability_marker(metric("c", 4, 0)), " [stable]");
        EXPECT_EQ(instability_marker(metric("d", 1, 1)), "");
        EXPECT_EQ(instability_marker(metric("e", 0, 0)), "");
    }

    TEST_F(FormatterTest, TableAlignsColumns) {
        Table table({{"Name", 0, false}, {"N", 3, true}});
        table.add_row({"alpha", "1"});
        table.add_row({"b", "22"});

        EXPECT_EQ(table.render(),
                  "Name     N\n"
                  "----------\n"
                  "alpha    1\n"
                  "b       22\n");
    }

    TEST_F(FormatterTest, TableTruncatesLongCells) {
        Table table({{"Col", 6, false}});
        table.set_show_headers(false);
        table.add_row({"abcdefghij"});

        EXPECT_EQ(table.render(), "abc...\n");
    }

    TEST_F(FormatterTest, TableSeparators) {
        Table table({{"A", 2, false}});
        table.set_show_headers(false);
        table.add_row({"x"});
        table.add_separator();
        table.add_row({"y"});

        EXPECT_EQ(table.render(), "x\n--\ny\n");
    }

    TEST_F(FormatterTest, ScanSummary) {
        scanner::ScanResult scan;
        scan.root = "/projects/shop";
        graph::GraphBuilder builder;
        builder.add_edge("a", "b");
        scan.graph = builder.build();
        scan.modules.resize(2);
        scan.stats.files_seen = 2;
        scan.stats.parse_errors = 1;

        SummaryPrinter(out).print_scan_summary(scan);

        const auto text = out.str();
        EXPECT_NE(text.find("[OK] Scan complete: /projects/shop"), std::string::npos);
        EXPECT_NE(text.find("Files: 2 | Modules: 2 | Dependencies: 1 | Time: 0.000s"), std::string::npos);
        EXPECT_NE(text.find("[!] 1 file(s) had parse errors"), std::string::npos);
    }

    TEST_F(FormatterTest, Cycles) {
        SummaryPrinter(out).print_cycles({});
        EXPECT_EQ(out.str(), "[OK] No circular imports detected!\n");

        out.str("");
        SummaryPrinter(out).print_cycles({graph::Cycle{{"a", "b"}}});
        EXPECT_EQ(out.str(), "[!] Found 1 circular import chain(s):\n\n  Cycle 1: a -> b -> a\n");
    }

    TEST_F(FormatterTest, Tree) {
        SummaryPrinter(out).print_tree({});
        EXPECT_NE(out.str().find("(no local dependencies found)"), std::string::npos);

        graph::GraphBuilder builder;
        builder.add_edge("main", "app");
        const auto tree = graph::render_tree(builder.build());
        ASSERT_TRUE(tree.is_ok());

        out.str("");
        SummaryPrinter(out).print_tree(tree.value());
        EXPECT_EQ(out.str(), "DEPENDENCY TREE\n" + std::string(50, '-') + "\nmain\n`-- app\n");
    }

    TEST_F(FormatterTest, Metrics) {
        SummaryPrinter(out).print_metrics({metric("app.main", 0, 2), metric("app.core", 2, 0), metric("mid", 1, 1)});

        const auto text = out.str();
        EXPECT_NE(text.find("Module     Fan-In   Fan-Out   Instab."), std::string::npos);
        EXPECT_NE(text.find("app.main        0         2     1.000  [!]"), std::string::npos);
        EXPECT_NE(text.find("app.core        2         0     0.000  [stable]"), std::string::npos);
        EXPECT_NE(text.find("mid             1         1     0.500\n"), std::string::npos);
    }

    TEST_F(FormatterTest, Orphans) {
        SummaryPrinter(out).print_orphans({});
        EXPECT_EQ(out.str(), "[OK] All modules are imported by at least one other module.\n");

        out.str("");
        graph::Orphan orphan;
        orphan.module = "scripts.cleanup";
        SummaryPrinter(out).print_orphans({orphan});
        EXPECT_NE(out.str().find("ORPHAN MODULES (1 found)"), std::string::npos);
        EXPECT_NE(out.str().find("  scripts.cleanup (standalone / potential dead code)"), std::string::npos);
    }
}  // namespace depmap::cli
