//
// Created by gregorian-rayne on 1/22/26.
//

#include "depmap/cli/commands/scanning_command.hpp"
#include "depmap/cli/formatter.hpp"
#include "depmap/graph/tree.hpp"

#include <iostream>

namespace depmap::cli
{
    /**
     * Orphans command - modules nothing else imports.
     */
    class OrphansCommand : public ScanningCommand {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "orphans";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Find modules with no inbound imports";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return scan_arguments();
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

            const auto orphans = graph::find_orphans(session->scan.graph);

            print_summary(session->scan);
            if (!is_quiet()) {
                std::cout << "\n";
            }
            SummaryPrinter(std::cout).print_orphans(orphans);
            return 0;
        }
    };

    namespace {
        struct OrphansCommandRegistrar {
            OrphansCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<OrphansCommand>()
                );
            }
        } orphans_registrar;
    }
}  // namespace depmap::cli
