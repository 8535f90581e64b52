//
// Created by gregorian-rayne on 1/19/26.
//

#include "depmap/scanner/scanner.hpp"
#include "depmap/scanner/module_registry.hpp"
#include "depmap/scanner/source_walker.hpp"
#include "depmap/extractors/all_extractors.hpp"
#include "depmap/resolve/import_resolver.hpp"
#include "depmap/resolve/stdlib_table.hpp"
#include "depmap/utils/file_utils.hpp"
#include "depmap/utils/parallel.hpp"
#include "depmap/utils/string_utils.hpp"

#include <algorithm>
#include <chrono>
#include <set>

namespace depmap::scanner {

    namespace {

        struct SourceJob {
            fs::path path;
            ModuleName name;
            const extractors::IImportExtractor* extractor = nullptr;
        };

        struct Extracted {
            std::vector<RawImport> imports;
            std::optional<std::string> error;
            std::size_t line_count = 0;
        };

        Extracted extract_one(const SourceJob& job) {
            Extracted out;

            auto content = file_utils::read_file(job.path);
            if (content.is_err()) {
                out.error = "Read error: " + content.error().message();
                return out;
            }

            out.line_count = file_utils::count_lines(content.value());

            auto imports = job.extractor->extract(content.value(), job.name.id);
            if (imports.is_err()) {
                out.error = imports.error().message();
                return out;
            }
            out.imports = std::move(imports.value());
            return out;
        }

        fs::path absolute_root(const fs::path& root) {
            std::error_code ec;
            auto resolved = fs::weakly_canonical(root, ec);
            if (ec) {
                resolved = fs::absolute(root, ec).lexically_normal();
            }
            return resolved;
        }

        std::vector<std::string> effective_excludes(const ScanOptions& options) {
            std::vector<std::string> excludes;
            if (options.use_default_excludes) {
                excludes = default_excludes();
            }
            excludes.insert(excludes.end(), options.exclude.begin(), options.exclude.end());
            return excludes;
        }

        std::vector<std::string> all_extensions() {
            std::vector<std::string> extensions;
            for (const auto* extractor : extractors::ExtractorRegistry::instance().list()) {
                for (auto& ext : extractor->supported_extensions()) {
                    extensions.push_back(std::move(ext));
                }
            }
            return extensions;
        }

        std::vector<std::string> to_sorted_vector(const std::set<std::string>& items) {
            return {items.begin(), items.end()};
        }

    }  // namespace

    // ============================================================================
    // ScanResult
    // ============================================================================

    const Module* ScanResult::find_module(const ModuleId& id) const {
        const auto it = std::ranges::lower_bound(modules, id, {}, &Module::id);
        if (it == modules.end() || it->id != id) {
            return nullptr;
        }
        return &*it;
    }

    std::vector<const Module*> ScanResult::parse_failures() const {
        std::vector<const Module*> failures;
        for (const auto& module : modules) {
            if (module.has_parse_error()) {
                failures.push_back(&module);
            }
        }
        return failures;
    }

    // ============================================================================
    // scan
    // ============================================================================

    Result<ScanResult, Error> scan(const fs::path& root, const ScanOptions& options) {
        const auto started = std::chrono::steady_clock::now();

        std::error_code ec;
        if (!fs::exists(root, ec)) {
            return Result<ScanResult, Error>::failure(
                Error::path_not_found("Path not found", root.string())
            );
        }

        extractors::register_all_extractors();
        const auto& extractor_registry = extractors::ExtractorRegistry::instance();

        ScanResult result;
        result.root = absolute_root(root);

        // Discovery
        std::vector<fs::path> files;
        if (fs::is_regular_file(result.root, ec)) {
            if (extractor_registry.find_for_file(result.root) == nullptr) {
                return Result<ScanResult, Error>::failure(
                    Error::invalid_argument("Unsupported source file", root.string())
                );
            }
            files.push_back(result.root);
            result.project_name = result.root.stem().string();
        } else {
            auto collected = collect_source_files(result.root, all_extensions(), effective_excludes(options));
            if (collected.is_err()) {
                return Result<ScanResult, Error>::failure(collected.error());
            }
            files = std::move(collected.value());
            result.project_name = result.root.filename().string();
        }

        std::vector<SourceJob> jobs;
        jobs.reserve(files.size());
        for (auto& file : files) {
            const auto* extractor = extractor_registry.find_for_file(file);
            if (extractor == nullptr) {
                continue;
            }
            auto name = derive_module_name(result.root, file, extractor->package_marker());
            if (name.is_err()) {
                return Result<ScanResult, Error>::failure(name.error());
            }
            jobs.push_back({std::move(file), std::move(name.value()), extractor});
        }

        // Extraction, merged back in file order
        auto extracted = parallel::map(jobs, extract_one, options.threads);

        ModuleRegistry registry;
        std::map<ModuleId, std::vector<RawImport>> raw_imports;

        result.stats.files_seen = jobs.size();
        for (std::size_t i = 0; i < jobs.size(); ++i) {
            auto& job = jobs[i];
            auto& out = extracted[i];

            Module module;
            module.id = job.name.id;
            module.path = job.path;
            module.is_package = job.name.is_package;
            module.package = job.name.package;
            module.parse_error = out.error;
            module.line_count = out.line_count;
            module.import_count = out.imports.size();

            switch (registry.add(std::move(module))) {
                case ModuleRegistry::AddOutcome::Added:
                    raw_imports[job.name.id] = std::move(out.imports);
                    break;
                case ModuleRegistry::AddOutcome::Replaced:
                    ++result.stats.shadowed_files;
                    raw_imports[job.name.id] = std::move(out.imports);
                    break;
                case ModuleRegistry::AddOutcome::Shadowed:
                    ++result.stats.shadowed_files;
                    break;
            }
        }

        // Only failures of modules that stay registered are counted
        result.stats.parse_errors = static_cast<std::size_t>(std::ranges::count_if(
            registry.modules(), [](const auto& entry) { return entry.second.parse_error.has_value(); }));

        // Resolution and graph construction
        auto stdlib = resolve::StdlibTable::python();
        stdlib.add_all(options.extra_stdlib_modules);
        const resolve::ImportResolver resolver(registry, std::move(stdlib));

        graph::GraphBuilder builder;
        for (const auto& [id, module] : registry.modules()) {
            builder.add_node(id);

            std::set<std::string> local, standard_library, third_party, relative, unresolved;
            for (const auto& raw : raw_imports[id]) {
                const auto resolution = resolver.resolve(raw, module);
                const auto top = std::string(string_utils::first_component(raw.target));

                if (raw.is_relative()) {
                    relative.insert(raw.spelling());
                }

                switch (resolution.classification) {
                    case ImportClass::Local:
                        builder.add_edge(id, *resolution.target);
                        local.insert(*resolution.target);
                        break;
                    case ImportClass::StandardLibrary:
                        standard_library.insert(top);
                        break;
                    case ImportClass::ThirdParty:
                        third_party.insert(top);
                        break;
                    case ImportClass::Unresolvable:
                        unresolved.insert(raw.spelling());
                        break;
                }
            }

            result.imports[id] = ImportBreakdown{
                to_sorted_vector(local),
                to_sorted_vector(standard_library),
                to_sorted_vector(third_party),
                to_sorted_vector(relative),
                to_sorted_vector(unresolved)
            };
            result.modules.push_back(module);
        }

        result.graph = builder.build();
        result.stats.elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started);

        return Result<ScanResult, Error>::success(std::move(result));
    }

}  // namespace depmap::scanner
