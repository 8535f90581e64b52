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
     * Report command - full analysis report as text, JSON or Markdown.
     */
    class ReportCommand : public ScanningCommand {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "report";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Generate full analysis report";
        }

        [[nodiscard]] std::string usage() const override {
            return ScanningCommand::usage() + "\n"
                   "\n"
                   "Without --json or --markdown the format follows the output file\n"
                   "extension (.json, .md), falling back to plain text for any other.\n"
                   "\n"
                   "Examples:\n"
                   "  depmap report ./src\n"
                   "  depmap report ./src --markdown -o DEPENDENCIES.md\n"
                   "  depmap report ./src -o deps.json";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto args = scan_arguments();
            args.push_back({"json", 0, "Output as JSON", false, false, "", ""});
            args.push_back({"markdown", 0, "Output as Markdown", false, false, "", ""});
            args.push_back({"output", 'o', "Write the report to a file", false, true, "", "FILE"});
            return args;
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.get_flag("json") && args.get_flag("markdown")) {
                return "--json and --markdown are mutually exclusive";
            }
            return ScanningCommand::validate(args);
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

            const auto output = args.get("output");

            auto exporter = create_exporter(args, output);
            if (exporter.is_err()) {
                report_error(exporter.error());
                return 1;
            }

            const auto report = exporters::build_report(session->scan, report_options(session->config));
            print_debug("Exporting " + std::string(exporter.value()->format_name()) + " report");

            if (!output) {
                if (auto written = exporter.value()->export_to_stream(std::cout, report, {}); written.is_err()) {
                    report_error(written.error());
                    return 1;
                }
                return 0;
            }

            if (auto written = exporter.value()->export_to_file(*output, report, {}); written.is_err()) {
                report_error(written.error().with_context("saving report"));
                return 1;
            }

            print(colorize("[OK]", colors::GREEN) + " Report saved to: " + *output);
            return 0;
        }

    private:
        static Result<std::unique_ptr<exporters::IExporter>, Error> create_exporter(
            const ParsedArgs& args,
            const std::optional<std::string>& output
        ) {
            if (args.get_flag("json")) {
                return exporters::ExporterFactory::create(exporters::ExportFormat::JSON);
            }
            if (args.get_flag("markdown")) {
                return exporters::ExporterFactory::create(exporters::ExportFormat::Markdown);
            }
            if (output) {
                // .dot and unknown extensions fall back to text
                if (auto by_extension = exporters::ExporterFactory::create_for_file(*output);
                    by_extension.is_ok() && by_extension.value()->format() != exporters::ExportFormat::Dot) {
                    return by_extension;
                }
            }
            return exporters::ExporterFactory::create(exporters::ExportFormat::Text);
        }
    };

    namespace {
        struct ReportCommandRegistrar {
            ReportCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<ReportCommand>()
                );
            }
        } report_registrar;
    }
}  // namespace depmap::cli
