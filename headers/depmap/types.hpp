//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef DEPMAP_TYPES_HPP
#define DEPMAP_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data records shared by the scanner, resolver and graph layers.
 *
 * - Basic Types: ModuleId, Duration
 * - Extraction: ImportKind, RawImport
 * - Registry: Module
 * - Resolution: ImportClass
 * - Scan bookkeeping: ScanStats
 */

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <filesystem>

namespace depmap {

    namespace fs = std::filesystem;

    // ============================================================================
    // Basic Types
    // ============================================================================

    /**
     * Canonical dotted module path relative to the scan root ("pkg.sub.mod").
     */
    using ModuleId = std::string;

    using Duration = std::chrono::nanoseconds;

    // ============================================================================
    // Extraction
    // ============================================================================

    /**
     * Syntactic form of an import declaration.
     */
    enum class ImportKind {
        Absolute,   ///< import a.b / from a.b import c
        Relative,   ///< from .a import b (depth >= 1)
        Star        ///< from a import * (depth may be >= 1)
    };

    inline const char* to_string(ImportKind kind) noexcept {
        switch (kind) {
            case ImportKind::Absolute: return "absolute";
            case ImportKind::Relative: return "relative";
            case ImportKind::Star:     return "star";
        }
        return "unknown";
    }

    /**
     * One import declaration as written in a module's source.
     *
     * For `from X import n` the target is "X.n"; the resolver's
     * longest-prefix rule decides whether that names a submodule or a
     * symbol inside X. Relative targets exclude the leading dots, which
     * are counted in depth.
     */
    struct RawImport {
        std::string target;
        ImportKind kind = ImportKind::Absolute;
        std::size_t depth = 0;
        ModuleId origin;
        std::size_t line = 0;

        [[nodiscard]] bool is_relative() const noexcept {
            return depth > 0;
        }

        /**
         * Source spelling of the referenced module, dots included (".utils").
         */
        [[nodiscard]] std::string spelling() const {
            return std::string(depth, '.') + target;
        }
    };

    // ============================================================================
    // Registry
    // ============================================================================

    /**
     * A discovered local module. Created once per scan, never mutated
     * after registration.
     */
    struct Module {
        ModuleId id;
        fs::path path;
        bool is_package = false;

        /**
         * Dotted package the module lives in; relative imports climb from
         * here. Equal to id for packages, empty for root-level modules.
         */
        std::string package;

        std::optional<std::string> parse_error;
        std::size_t line_count = 0;
        std::size_t import_count = 0;

        [[nodiscard]] bool has_parse_error() const noexcept {
            return parse_error.has_value();
        }
    };

    // ============================================================================
    // Resolution
    // ============================================================================

    /**
     * Closed classification of a raw import.
     */
    enum class ImportClass {
        Local,
        StandardLibrary,
        ThirdParty,
        Unresolvable
    };

    inline const char* to_string(ImportClass cls) noexcept {
        switch (cls) {
            case ImportClass::Local:           return "local";
            case ImportClass::StandardLibrary: return "stdlib";
            case ImportClass::ThirdParty:      return "third_party";
            case ImportClass::Unresolvable:    return "unresolved";
        }
        return "unknown";
    }

    // ============================================================================
    // Scan bookkeeping
    // ============================================================================

    struct ScanStats {
        std::size_t files_seen = 0;
        std::size_t parse_errors = 0;
        std::size_t shadowed_files = 0;   ///< Module files hidden by a same-named package
        Duration elapsed = Duration::zero();

        [[nodiscard]] double elapsed_seconds() const noexcept {
            return std::chrono::duration<double>(elapsed).count();
        }
    };

}  // namespace depmap

#endif //DEPMAP_TYPES_HPP
