//
// Created by gregorian-rayne on 1/22/26.
//

#include "depmap/cli/commands/scanning_command.hpp"
#include "depmap/cli/formatter.hpp"
#include "depmap/graph/coupling.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace depmap::cli
{
    using json = nlohmann::json;

    /**
     * Metrics command - fan-in, fan-out and instability per module.
     */
    class MetricsCommand : public ScanningCommand {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "metrics";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Show coupling metrics";
        }

        [[nodiscard]] std::string usage() const override {
            return ScanningCommand::usage() + "\n"
                   "\n"
                   "Examples:\n"
                   "  depmap metrics ./src\n"
                   "  depmap metrics ./src --sort fan_in\n"
                   "  depmap metrics ./src --json";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto args = scan_arguments();
            args.push_back({"sort", 's', "Sort by instability, fan_in, fan_out or name (default: instability)", false, true, "", "KEY"});
            args.push_back({"json", 0, "Output as JSON", false, false, "", ""});
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

            const auto key = graph::sort_key_from_string(
                args.get_or("sort", session->config.analysis.metrics_sort));
            if (key.is_err()) {
                report_error(key.error());
                return 1;
            }

            const auto metrics = graph::compute_metrics(session->scan.graph, key.value());

            if (args.get_flag("json")) {
                json output = json::array();
                for (const auto& metric : metrics) {
                    output.push_back(json{
                        {"module", metric.module},
                        {"fan_in", metric.fan_in},
                        {"fan_out", metric.fan_out},
                        {"instability", graph::rounded_instability(metric)}
                    });
                }
                std::cout << output.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
                return 0;
            }

            print_summary(session->scan);
            if (!is_quiet()) {
                std::cout << "\n";
            }
            SummaryPrinter(std::cout).print_metrics(metrics);
            return 0;
        }
    };

    namespace {
        struct MetricsCommandRegistrar {
            MetricsCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<MetricsCommand>()
                );
            }
        } metrics_registrar;
    }
}  // namespace depmap::cli
