//
// Created by gregorian-rayne on 1/22/26.
//

#include "depmap/cli/commands/scanning_command.hpp"
#include "depmap/cli/formatter.hpp"
#include "depmap/graph/coupling.hpp"
#include "depmap/scanner/source_walker.hpp"
#include "depmap/utils/string_utils.hpp"
#include "depmap/version.hpp"

#include <iostream>
#include <sstream>

namespace depmap::cli
{
    std::string ScanningCommand::usage() const {
        std::ostringstream ss;
        ss << "Usage: " << PROJECT_SHORT_NAME << " " << name() << " <path> [OPTIONS]";
        return ss.str();
    }

    std::string ScanningCommand::validate(const ParsedArgs& args) const {
        if (auto error = Command::validate(args); !error.empty()) {
            return error;
        }
        if (args.positional().empty()) {
            return "Missing project path";
        }
        if (args.positional().size() > 1) {
            return "Unexpected argument: " + args.positional()[1];
        }
        return "";
    }

    std::vector<ArgDef> ScanningCommand::scan_arguments() {
        return {
            {"exclude", 0, "Comma-separated directories to exclude (replaces defaults)", false, true, "", "DIRS"},
            {"config", 0, "Configuration file (default: <path>/.depmap.toml)", false, true, "", "FILE"}
        };
    }

    std::optional<ScanningCommand::Session> ScanningCommand::prepare(const ParsedArgs& args) {
        const fs::path root = args.positional().front();

        core::Config config = core::Config::default_config();

        std::optional<fs::path> config_path;
        if (auto explicit_path = args.get("config")) {
            config_path = fs::path(*explicit_path);
        } else {
            config_path = core::Config::find_project_config(root);
        }

        if (config_path) {
            auto loaded = core::Config::load_from_file(*config_path);
            if (loaded.is_err()) {
                report_error(loaded.error());
                return std::nullopt;
            }
            config = std::move(loaded).value();
        }

        // Command-line flags win over the configured level
        Verbosity level = verbosity_from_string(config.output.verbosity).value_or(Verbosity::Normal);
        if (args.get_flag("quiet")) {
            level = Verbosity::Quiet;
        } else if (args.get_flag("verbose") && level < Verbosity::Verbose) {
            level = Verbosity::Verbose;
        }
        set_verbosity(level);

        colors::set_enabled(config.output.color && !args.get_flag("no-color"));

        if (config_path) {
            print_debug("Loaded configuration from " + config_path->string());
        }

        scanner::ScanOptions options = config.scan_options();
        if (auto exclude = args.get("exclude")) {
            options.exclude = string_utils::split_list(*exclude);
            options.use_default_excludes = false;
        }

        if (is_verbose()) {
            std::vector<std::string> excludes;
            if (options.use_default_excludes) {
                excludes = scanner::default_excludes();
            }
            excludes.insert(excludes.end(), options.exclude.begin(), options.exclude.end());
            print_verbose("Excluding: " + (excludes.empty() ? std::string("(nothing)") : string_utils::join(excludes, ", ")));
        }

        print_debug("Scanning " + root.string());

        auto scanned = scanner::scan(root, options);
        if (scanned.is_err()) {
            report_error(scanned.error());
            return std::nullopt;
        }

        Session session{std::move(config), std::move(scanned).value()};

        if (is_verbose()) {
            for (const Module* failed : session.scan.parse_failures()) {
                print_warning(failed->id + ": " + failed->parse_error.value_or(""));
            }
        }
        if (session.scan.stats.shadowed_files > 0) {
            print_debug(std::to_string(session.scan.stats.shadowed_files) +
                        " module file(s) shadowed by a package of the same name");
        }

        return session;
    }

    void ScanningCommand::print_summary(const scanner::ScanResult& scan) const {
        if (is_quiet()) {
            return;
        }
        SummaryPrinter(std::cout).print_scan_summary(scan);
    }

    exporters::ReportOptions ScanningCommand::report_options(const core::Config& config) {
        exporters::ReportOptions options;
        options.max_cycle_length = static_cast<std::size_t>(config.analysis.max_cycle_length);
        options.tree_depth = static_cast<std::size_t>(config.analysis.tree_depth);

        // validate() already rejected unknown keys
        if (auto key = graph::sort_key_from_string(config.analysis.metrics_sort); key.is_ok()) {
            options.metrics_sort = key.value();
        }
        return options;
    }

    void ScanningCommand::report_error(const Error& error) {
        std::string message = error.message();
        if (error.has_context()) {
            message += ": " + *error.context();
        }
        print_error(message);
    }

}  // namespace depmap::cli
