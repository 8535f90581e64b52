//
// Created by gregorian-rayne on 1/22/26.
//

#ifndef DEPMAP_SCANNING_COMMAND_HPP
#define DEPMAP_SCANNING_COMMAND_HPP

/**
 * @file scanning_command.hpp
 * @brief Base for commands that scan a project before analysing it.
 *
 * Every analysis command takes one positional root path, an optional
 * `--exclude a,b,c` and `--config FILE`. The project's `.depmap.toml` is
 * picked up from the root when no config file is given.
 */

#include "depmap/cli/commands/command.hpp"
#include "depmap/core/config.hpp"
#include "depmap/error.hpp"
#include "depmap/exporters/report.hpp"
#include "depmap/scanner/scanner.hpp"

#include <optional>
#include <string>
#include <vector>

namespace depmap::cli
{
    class ScanningCommand : public Command {
    public:
        [[nodiscard]] std::string usage() const override;

        /**
         * Requires exactly one root path besides the base checks.
         */
        [[nodiscard]] std::string validate(const ParsedArgs& args) const override;

    protected:
        struct Session {
            core::Config config;
            scanner::ScanResult scan;
        };

        /**
         * --exclude and --config, shared by every scanning command.
         */
        [[nodiscard]] static std::vector<ArgDef> scan_arguments();

        /**
         * Loads the configuration, applies verbosity and color settings
         * and scans the root. Failures are printed; nullopt means the
         * command should exit with 1.
         */
        [[nodiscard]] std::optional<Session> prepare(const ParsedArgs& args);

        /**
         * Scan summary on stdout, suppressed in quiet mode.
         */
        void print_summary(const scanner::ScanResult& scan) const;

        [[nodiscard]] static exporters::ReportOptions report_options(const core::Config& config);

        static void report_error(const Error& error);
    };

}  // namespace depmap::cli

#endif //DEPMAP_SCANNING_COMMAND_HPP
