//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef DEPMAP_MODULE_REGISTRY_HPP
#define DEPMAP_MODULE_REGISTRY_HPP

/**
 * @file module_registry.hpp
 * @brief Discovered local modules and module id derivation.
 *
 * Module ids are dotted paths relative to the scan root:
 * @code
 *     root/app.py                ->  app
 *     root/pkg/__init__.py       ->  pkg        (package)
 *     root/pkg/sub/mod.py        ->  pkg.sub.mod
 *     root/__init__.py           ->  <root directory name> (package)
 * @endcode
 */

#include "depmap/result.hpp"
#include "depmap/error.hpp"
#include "depmap/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace depmap::scanner {

    /**
     * Identity of a module derived from its file location.
     */
    struct ModuleName {
        ModuleId id;
        bool is_package = false;
        std::string package;
    };

    /**
     * Derives the module id of a source file.
     *
     * @param root Scan root directory, or the file itself for a single-file scan.
     * @param file Source file inside root.
     * @param package_marker File stem marking a package ("__init__").
     * @return The derived name, or InvalidArgument when file is outside root.
     */
    [[nodiscard]] Result<ModuleName, Error> derive_module_name(
        const fs::path& root,
        const fs::path& file,
        std::string_view package_marker
    );

    /**
     * Set of registered modules, keyed and iterated by id.
     */
    class ModuleRegistry {
    public:
        enum class AddOutcome {
            Added,
            Replaced,   ///< A package displaced a same-named module file
            Shadowed    ///< Rejected: the id is already taken
        };

        /**
         * Registers a module. When a module file and a package share an
         * id the package wins; otherwise the first registration is kept.
         */
        AddOutcome add(Module module);

        [[nodiscard]] bool contains(std::string_view id) const;
        [[nodiscard]] const Module* find(std::string_view id) const;

        /**
         * True when name is a registered id or a dotted prefix of one
         * ("pkg" for "pkg.core"), i.e. when it names local code.
         */
        [[nodiscard]] bool has_prefix(std::string_view name) const;

        /**
         * Longest registered dotted prefix of name that keeps at least
         * min_components components.
         */
        [[nodiscard]] std::optional<ModuleId> longest_prefix_match(
            std::string_view name,
            std::size_t min_components
        ) const;

        /**
         * Id of the root-level package when the scan root itself has a
         * package marker.
         */
        [[nodiscard]] const std::optional<ModuleId>& root_package() const noexcept { return root_package_; }

        [[nodiscard]] const std::map<ModuleId, Module, std::less<>>& modules() const noexcept { return modules_; }
        [[nodiscard]] std::size_t size() const noexcept { return modules_.size(); }

    private:
        void index_prefixes(std::string_view id);

        std::map<ModuleId, Module, std::less<>> modules_;
        std::unordered_set<std::string> prefixes_;
        std::optional<ModuleId> root_package_;
    };

}  // namespace depmap::scanner

#endif //DEPMAP_MODULE_REGISTRY_HPP
