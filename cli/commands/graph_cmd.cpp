//
// Created by gregorian-rayne on 1/22/26.
//

#include "depmap/cli/commands/scanning_command.hpp"
#include "depmap/cli/formatter.hpp"
#include "depmap/exporters/exporter.hpp"

#include <iostream>

namespace depmap::cli
{
    /**
     * Graph command - Graphviz DOT output of the local dependency graph.
     */
    class GraphCommand : public ScanningCommand {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "graph";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Generate Graphviz DOT graph";
        }

        [[nodiscard]] std::string usage() const override {
            return ScanningCommand::usage() + "\n"
                   "\n"
                   "Examples:\n"
                   "  depmap graph ./src -o deps.dot\n"
                   "  depmap graph ./src --no-highlight | dot -Tsvg -o deps.svg";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto args = scan_arguments();
            args.push_back({"output", 'o', "Write the graph to a file", false, true, "", "FILE"});
            args.push_back({"no-highlight", 0, "Do not draw cycle edges in red", false, false, "", ""});
            return args;
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            auto session = prepare(args);
            if (!session) {
                return 1;
            }

            exporters::ExportOptions options;
            options.highlight_cycles = !args.get_flag("no-highlight");

            exporters::DotExporter exporter;
            const auto report = exporters::build_report(session->scan, report_options(session->config));

            const auto output = args.get("output");
            if (!output) {
                if (auto written = exporter.export_to_stream(std::cout, report, options); written.is_err()) {
                    report_error(written.error());
                    return 1;
                }
                return 0;
            }

            if (auto written = exporter.export_to_file(*output, report, options); written.is_err()) {
                report_error(written.error().with_context("saving graph"));
                return 1;
            }

            const fs::path output_path(*output);
            print(colorize("[OK]", colors::GREEN) + " DOT graph saved to: " + *output);
            print("     Render with: dot -Tpng " + *output + " -o " + output_path.stem().string() + ".png");
            return 0;
        }
    };

    namespace {
        struct GraphCommandRegistrar {
            GraphCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<GraphCommand>()
                );
            }
        } graph_registrar;
    }
}  // namespace depmap::cli
