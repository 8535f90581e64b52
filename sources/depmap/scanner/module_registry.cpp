//
// Created by gregorian-rayne on 1/16/26.
//

#include "depmap/scanner/module_registry.hpp"
#include "depmap/utils/string_utils.hpp"

#include <vector>

namespace depmap::scanner {

    namespace {

        /**
         * Name of a directory as the user sees it, resolving "." and a
         * trailing separator.
         */
        std::string directory_name(const fs::path& dir) {
            std::error_code ec;
            fs::path resolved = fs::weakly_canonical(dir, ec);
            if (ec) {
                resolved = fs::absolute(dir, ec).lexically_normal();
            }
            if (resolved.filename().empty()) {
                resolved = resolved.parent_path();
            }
            return resolved.filename().string();
        }

    }  // namespace

    // ============================================================================
    // Module id derivation
    // ============================================================================

    Result<ModuleName, Error> derive_module_name(
        const fs::path& root,
        const fs::path& file,
        const std::string_view package_marker
    ) {
        const auto stem = file.stem().string();

        if (root.lexically_normal() == file.lexically_normal()) {
            if (stem == package_marker) {
                const fs::path dir = file.has_parent_path() ? file.parent_path() : fs::path(".");
                return Result<ModuleName, Error>::success({directory_name(dir), true, ""});
            }
            return Result<ModuleName, Error>::success({stem, false, ""});
        }

        const fs::path relative = file.lexically_normal().lexically_relative(root.lexically_normal());
        if (relative.empty() || *relative.begin() == "..") {
            return Result<ModuleName, Error>::failure(
                Error::invalid_argument("File is outside the scan root", file.string())
            );
        }

        std::vector<std::string> parts;
        for (const auto& part : relative.parent_path()) {
            if (part != ".") {
                parts.push_back(part.string());
            }
        }

        if (stem == package_marker) {
            if (parts.empty()) {
                return Result<ModuleName, Error>::success({directory_name(root), true, ""});
            }
            auto id = string_utils::join(parts, ".");
            return Result<ModuleName, Error>::success({id, true, id});
        }

        auto package = string_utils::join(parts, ".");
        auto id = string_utils::join_dotted(package, stem);
        return Result<ModuleName, Error>::success({std::move(id), false, std::move(package)});
    }

    // ============================================================================
    // ModuleRegistry
    // ============================================================================

    ModuleRegistry::AddOutcome ModuleRegistry::add(Module module) {
        const bool root_level_package = module.is_package && module.package.empty();

        if (const auto it = modules_.find(module.id); it != modules_.end()) {
            if (module.is_package && !it->second.is_package) {
                if (root_level_package) {
                    root_package_ = module.id;
                }
                it->second = std::move(module);
                return AddOutcome::Replaced;
            }
            return AddOutcome::Shadowed;
        }

        if (root_level_package) {
            root_package_ = module.id;
        }
        index_prefixes(module.id);
        auto id = module.id;
        modules_.emplace(std::move(id), std::move(module));
        return AddOutcome::Added;
    }

    void ModuleRegistry::index_prefixes(const std::string_view id) {
        for (std::size_t pos = id.find('.'); pos != std::string_view::npos; pos = id.find('.', pos + 1)) {
            prefixes_.emplace(id.substr(0, pos));
        }
        prefixes_.emplace(id);
    }

    bool ModuleRegistry::contains(const std::string_view id) const {
        return modules_.find(id) != modules_.end();
    }

    const Module* ModuleRegistry::find(const std::string_view id) const {
        const auto it = modules_.find(id);
        return it == modules_.end() ? nullptr : &it->second;
    }

    bool ModuleRegistry::has_prefix(const std::string_view name) const {
        return prefixes_.contains(std::string(name));
    }

    std::optional<ModuleId> ModuleRegistry::longest_prefix_match(
        const std::string_view name,
        const std::size_t min_components
    ) const {
        std::string_view candidate = name;
        std::size_t components = string_utils::component_count(name);

        while (!candidate.empty() && components >= min_components) {
            if (contains(candidate)) {
                return ModuleId(candidate);
            }
            candidate = string_utils::parent_name(candidate);
            --components;
        }
        return std::nullopt;
    }

}  // namespace depmap::scanner
