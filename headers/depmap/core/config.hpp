//
// Created by gregorian-rayne on 1/20/26.
//

#ifndef DEPMAP_CONFIG_HPP
#define DEPMAP_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Project configuration read from `.depmap.toml`.
 *
 * @code
 *     [scan]
 *     exclude = ["tests/fixtures", "migrations"]
 *     use_default_excludes = true
 *     threads = 0
 *
 *     [resolver]
 *     extra_stdlib_modules = ["_pytest"]
 *
 *     [analysis]
 *     max_cycle_length = 20
 *     tree_depth = 10
 *     metrics_sort = "instability"
 *
 *     [output]
 *     color = true
 *     verbosity = "normal"
 * @endcode
 */

#include "depmap/result.hpp"
#include "depmap/error.hpp"
#include "depmap/types.hpp"
#include "depmap/scanner/scanner.hpp"

#include <optional>
#include <string>
#include <vector>

namespace depmap::core {

    constexpr const char* CONFIG_FILE_NAME = ".depmap.toml";

    struct ScanConfig {
        std::vector<std::string> exclude;
        bool use_default_excludes = true;
        int threads = 0;
    };

    struct ResolverConfig {
        std::vector<std::string> extra_stdlib_modules;
    };

    struct AnalysisConfig {
        int max_cycle_length = 20;
        int tree_depth = 10;
        std::string metrics_sort = "instability";
    };

    struct OutputConfig {
        bool color = true;
        std::string verbosity = "normal";
    };

    class Config {
    public:
        Config() = default;

        ScanConfig scan;
        ResolverConfig resolver;
        AnalysisConfig analysis;
        OutputConfig output;

        /**
         * Load configuration from a TOML file.
         *
         * @param path Path to the config file.
         * @return The parsed and validated Config, NotFound when the file
         *         is missing, ConfigError when it is rejected.
         */
        static Result<Config, Error> load_from_file(const fs::path& path);

        /**
         * Load configuration from TOML text.
         */
        static Result<Config, Error> load_from_string(const std::string& content);

        static Config default_config();

        /**
         * `.depmap.toml` in the scan root (or beside a single scanned
         * file), when present.
         */
        static std::optional<fs::path> find_project_config(const fs::path& root);

        /**
         * Checks value ranges and enumerated settings.
         */
        [[nodiscard]] Result<void, Error> validate() const;

        /**
         * Serializes back to TOML.
         */
        [[nodiscard]] std::string to_string() const;

        /**
         * Scanner options described by the [scan] and [resolver] sections.
         */
        [[nodiscard]] scanner::ScanOptions scan_options() const;
    };

}  // namespace depmap::core

#endif //DEPMAP_CONFIG_HPP
