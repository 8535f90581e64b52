//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef DEPMAP_IMPORT_RESOLVER_HPP
#define DEPMAP_IMPORT_RESOLVER_HPP

/**
 * @file import_resolver.hpp
 * @brief Classifies raw imports and maps local ones to module ids.
 *
 * Precedence for an absolute target R with first component R0:
 * 1. When the scan root is itself a package named R0, R minus that
 *    prefix is matched against root-level ids.
 * 2. Longest registered prefix of R (at least R0) -> Local.
 * 3. R0 names local code but nothing matched -> Unresolvable.
 * 4. R0 in the standard-library table -> StandardLibrary.
 * 5. Anything else -> ThirdParty.
 *
 * Relative targets climb (depth - 1) packages from the importer's
 * package position and never fall back to absolute lookup. Climbing
 * above the scan root is Unresolvable.
 */

#include "depmap/types.hpp"
#include "depmap/resolve/stdlib_table.hpp"
#include "depmap/scanner/module_registry.hpp"

#include <optional>

namespace depmap::resolve {

    struct Resolution {
        ImportClass classification = ImportClass::Unresolvable;
        std::optional<ModuleId> target;     ///< Set only for Local

        [[nodiscard]] bool is_local() const noexcept {
            return classification == ImportClass::Local;
        }
    };

    /**
     * Pure resolution function over a registry snapshot and a stdlib
     * table. Safe to call concurrently.
     */
    class ImportResolver {
    public:
        ImportResolver(const scanner::ModuleRegistry& registry, StdlibTable stdlib);

        [[nodiscard]] Resolution resolve(const RawImport& raw, const Module& importer) const;

    private:
        [[nodiscard]] Resolution resolve_relative(const RawImport& raw, const Module& importer) const;
        [[nodiscard]] Resolution resolve_absolute(const RawImport& raw) const;

        const scanner::ModuleRegistry& registry_;
        StdlibTable stdlib_;
    };

}  // namespace depmap::resolve

#endif //DEPMAP_IMPORT_RESOLVER_HPP
