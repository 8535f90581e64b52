//
// Created by gregorian-rayne on 1/22/26.
//

#include "depmap/cli/commands/scanning_command.hpp"
#include "depmap/exporters/exporter.hpp"

#include <iostream>

namespace depmap::cli
{
    /**
     * Scan command - scans a project and prints the summary, optionally
     * followed by the full report.
     */
    class ScanCommand : public ScanningCommand {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "scan";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Scan a project and show summary";
        }

        [[nodiscard]] std::string usage() const override {
            return ScanningCommand::usage() + "\n"
                   "\n"
                   "Examples:\n"
                   "  depmap scan ./my_project\n"
                   "  depmap scan ./src --exclude tests,migrations\n"
                   "  depmap scan ./src --json";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto args = scan_arguments();
            args.push_back({"json", 0, "Print the full scan as JSON", false, false, "", ""});
            args.push_back({"markdown", 0, "Print the full scan as Markdown", false, false, "", ""});
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

            std::optional<exporters::ExportFormat> format;
            if (args.get_flag("json")) {
                format = exporters::ExportFormat::JSON;
            } else if (args.get_flag("markdown")) {
                format = exporters::ExportFormat::Markdown;
            }

            // Machine-readable output stays free of the summary
            if (!format) {
                print_summary(session->scan);
                return 0;
            }

            auto exporter = exporters::ExporterFactory::create(*format);
            if (exporter.is_err()) {
                report_error(exporter.error());
                return 1;
            }

            const auto report = exporters::build_report(session->scan, report_options(session->config));
            if (auto written = exporter.value()->export_to_stream(std::cout, report, {}); written.is_err()) {
                report_error(written.error());
                return 1;
            }
            return 0;
        }
    };

    namespace {
        struct ScanCommandRegistrar {
            ScanCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<ScanCommand>()
                );
            }
        } scan_registrar;
    }
}  // namespace depmap::cli
