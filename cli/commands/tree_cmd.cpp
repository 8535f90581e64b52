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
     * Tree command - prints the dependency tree from every root module or
     * from one start module.
     */
    class TreeCommand : public ScanningCommand {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "tree";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Show dependency tree";
        }

        [[nodiscard]] std::string usage() const override {
            return ScanningCommand::usage() + "\n"
                   "\n"
                   "Examples:\n"
                   "  depmap tree ./my_project\n"
                   "  depmap tree ./src --module app.main --depth 3";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto args = scan_arguments();
            args.push_back({"module", 'm', "Start tree from this module", false, true, "", "MODULE"});
            args.push_back({"depth", 'd', "Max tree depth (default: 10, or [analysis] tree_depth)", false, true, "", "N"});
            return args;
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.has("depth")) {
                if (const auto depth = args.get_int("depth"); !depth || *depth < 1) {
                    return "--depth must be a positive integer";
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

            const std::size_t depth = static_cast<std::size_t>(
                args.get_int("depth").value_or(session->config.analysis.tree_depth));

            std::optional<ModuleId> start;
            if (auto module = args.get("module")) {
                start = *module;
            }

            auto tree = graph::render_tree(session->scan.graph, start, depth);
            if (tree.is_err()) {
                report_error(tree.error());
                return 1;
            }

            print_summary(session->scan);
            if (!is_quiet()) {
                std::cout << "\n";
            }
            SummaryPrinter(std::cout).print_tree(tree.value());
            return 0;
        }
    };

    namespace {
        struct TreeCommandRegistrar {
            TreeCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<TreeCommand>()
                );
            }
        } tree_registrar;
    }
}  // namespace depmap::cli
