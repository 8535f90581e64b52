//
// Created by gregorian-rayne on 1/22/26.
//

#include "depmap/cli/commands/scanning_command.hpp"
#include "depmap/cli/formatter.hpp"
#include "depmap/graph/cycles.hpp"

#include <iostream>

namespace depmap::cli
{
    /**
     * Exit code when circular imports are found.
     */
    constexpr int EXIT_CYCLES_FOUND = 2;

    /**
     * Circular command - lists circular import chains. Exits with 2 when
     * any are found.
     */
    class CircularCommand : public ScanningCommand {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "circular";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Find circular imports";
        }

        [[nodiscard]] std::string usage() const override {
            return ScanningCommand::usage() + "\n"
                   "\n"
                   "Exit codes: 0 = no cycles, 1 = error, 2 = cycles found\n"
                   "\n"
                   "Examples:\n"
                   "  depmap circular ./src\n"
                   "  depmap circular ./src --max-length 5";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto args = scan_arguments();
            args.push_back({"max-length", 0, "Max cycle length to report (default: 20, or [analysis] max_cycle_length)", false, true, "", "N"});
            return args;
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.has("max-length")) {
                if (const auto length = args.get_int("max-length"); !length || *length < 1) {
                    return "--max-length must be a positive integer";
                }
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

            const std::size_t max_length = static_cast<std::size_t>(
                args.get_int("max-length").value_or(session->config.analysis.max_cycle_length));

            const auto cycles = graph::find_cycles(session->scan.graph, max_length);
            print_debug("Cycle search bounded at length " + std::to_string(max_length));
            if (cycles.size() >= graph::DEFAULT_MAX_CYCLES) {
                print_warning("Cycle search stopped after " + std::to_string(cycles.size()) +
                              " cycles; lower --max-length to narrow it");
            }

            print_summary(session->scan);
            if (!is_quiet()) {
                std::cout << "\n";
            }
            SummaryPrinter(std::cout).print_cycles(cycles);

            return cycles.empty() ? 0 : EXIT_CYCLES_FOUND;
        }
    };

    namespace {
        struct CircularCommandRegistrar {
            CircularCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<CircularCommand>()
                );
            }
        } circular_registrar;
    }
}  // namespace depmap::cli
