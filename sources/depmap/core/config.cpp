//
// Created by gregorian-rayne on 1/20/26.
//

#include "depmap/core/config.hpp"

#include "depmap/graph/coupling.hpp"
#include "depmap/utils/file_utils.hpp"
#include "depmap/utils/string_utils.hpp"

#include <toml++/toml.h>
#include <sstream>

namespace depmap::core {

    namespace {

        void write_list(std::ostringstream& ss, const char* key, const std::vector<std::string>& values) {
            ss << key << " = [";
            for (std::size_t i = 0; i < values.size(); ++i) {
                if (i > 0) ss << ", ";
                ss << "\"" << values[i] << "\"";
            }
            ss << "]\n";
        }

    }  // namespace

    Result<Config, Error> Config::load_from_file(const fs::path& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            if (content.error().code() == ErrorCode::NotFound) {
                return Result<Config, Error>::failure(
                    Error::not_found("Configuration file not found", path.string())
                );
            }
            return Result<Config, Error>::failure(content.error());
        }

        return load_from_string(content.value()).map_error([&](const Error& e) {
            return e.with_context(path.string());
        });
    }

    Result<Config, Error> Config::load_from_string(const std::string& content) {
        try {
            auto tbl = toml::parse(content);
            Config config;

            if (tbl["scan"]) {
                auto& scan = *tbl["scan"].as_table();
                if (scan["use_default_excludes"])
                    config.scan.use_default_excludes = scan["use_default_excludes"].value_or(true);
                if (scan["threads"])
                    config.scan.threads = scan["threads"].value_or(0);

                if (scan["exclude"] && scan["exclude"].is_array()) {
                    config.scan.exclude.clear();
                    for (auto& path : *scan["exclude"].as_array()) {
                        config.scan.exclude.emplace_back(path.value_or(""));
                    }
                }
            }

            if (tbl["resolver"]) {
                auto& resolver = *tbl["resolver"].as_table();
                if (resolver["extra_stdlib_modules"] && resolver["extra_stdlib_modules"].is_array()) {
                    config.resolver.extra_stdlib_modules.clear();
                    for (auto& name : *resolver["extra_stdlib_modules"].as_array()) {
                        config.resolver.extra_stdlib_modules.emplace_back(name.value_or(""));
                    }
                }
            }

            if (tbl["analysis"]) {
                auto& analysis = *tbl["analysis"].as_table();
                if (analysis["max_cycle_length"])
                    config.analysis.max_cycle_length = analysis["max_cycle_length"].value_or(20);
                if (analysis["tree_depth"])
                    config.analysis.tree_depth = analysis["tree_depth"].value_or(10);
                if (analysis["metrics_sort"])
                    config.analysis.metrics_sort = analysis["metrics_sort"].value_or("instability");
            }

            if (tbl["output"]) {
                auto& output = *tbl["output"].as_table();
                if (output["color"])
                    config.output.color = output["color"].value_or(true);
                if (output["verbosity"])
                    config.output.verbosity = output["verbosity"].value_or("normal");
            }

            if (auto validation_result = config.validate(); validation_result.is_err()) {
                return Result<Config, Error>::failure(validation_result.error());
            }

            return Result<Config, Error>::success(std::move(config));

        } catch (const toml::parse_error& err) {
            return Result<Config, Error>::failure(
                Error::config_error("Failed to parse TOML configuration: " + std::string(err.description()))
            );
        }
    }

    Config Config::default_config() {
        return Config{};
    }

    std::optional<fs::path> Config::find_project_config(const fs::path& root) {
        std::error_code ec;
        const auto dir = fs::is_directory(root, ec) ? root : root.parent_path();
        auto candidate = dir / CONFIG_FILE_NAME;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
        return std::nullopt;
    }

    Result<void, Error> Config::validate() const {
        std::vector<std::string> errors;

        if (scan.threads < 0) {
            errors.emplace_back("threads must be non-negative");
        }

        for (const auto& entry : scan.exclude) {
            if (string_utils::trim(entry).empty()) {
                errors.emplace_back("exclude entries must not be empty");
                break;
            }
        }

        if (analysis.max_cycle_length < 1) {
            errors.emplace_back("max_cycle_length must be at least 1");
        }

        if (analysis.tree_depth < 1) {
            errors.emplace_back("tree_depth must be at least 1");
        }

        if (graph::sort_key_from_string(analysis.metrics_sort).is_err()) {
            errors.emplace_back("metrics_sort must be one of: fan_in, fan_out, instability, name");
        }

        if (output.verbosity != "quiet" && output.verbosity != "normal" &&
            output.verbosity != "verbose" && output.verbosity != "debug") {
            errors.emplace_back("verbosity must be one of: quiet, normal, verbose, debug");
        }

        if (!errors.empty()) {
            return Result<void, Error>::failure(
                Error::config_error("Configuration validation failed:\n  " + string_utils::join(errors, "\n  "))
            );
        }

        return Result<void, Error>::success();
    }

    std::string Config::to_string() const {
        std::ostringstream ss;

        ss << "[scan]\n";
        write_list(ss, "exclude", scan.exclude);
        ss << "use_default_excludes = " << (scan.use_default_excludes ? "true" : "false") << "\n";
        ss << "threads = " << scan.threads << "\n\n";

        ss << "[resolver]\n";
        write_list(ss, "extra_stdlib_modules", resolver.extra_stdlib_modules);
        ss << "\n";

        ss << "[analysis]\n";
        ss << "max_cycle_length = " << analysis.max_cycle_length << "\n";
        ss << "tree_depth = " << analysis.tree_depth << "\n";
        ss << "metrics_sort = \"" << analysis.metrics_sort << "\"\n\n";

        ss << "[output]\n";
        ss << "color = " << (output.color ? "true" : "false") << "\n";
        ss << "verbosity = \"" << output.verbosity << "\"\n";

        return ss.str();
    }

    scanner::ScanOptions Config::scan_options() const {
        scanner::ScanOptions options;
        options.exclude = scan.exclude;
        options.use_default_excludes = scan.use_default_excludes;
        options.extra_stdlib_modules = resolver.extra_stdlib_modules;
        options.threads = static_cast<unsigned int>(scan.threads);
        return options;
    }

}  // namespace depmap::core
