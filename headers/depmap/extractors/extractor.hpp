//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef DEPMAP_EXTRACTOR_HPP
#define DEPMAP_EXTRACTOR_HPP

/**
 * @file extractor.hpp
 * @brief Import extractor interface and registry.
 *
 * An extractor turns one module's source text into the ordered list of
 * import declarations it contains, or fails with ParseFailure for that
 * module alone. Each source language gets one extractor implementation;
 * the scanner picks one per file through the registry.
 *
 * Supported languages:
 * - Python: .py files, `__init__` package markers
 */

#include "depmap/result.hpp"
#include "depmap/error.hpp"
#include "depmap/types.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <mutex>
#include <filesystem>

namespace depmap::extractors {

    namespace fs = std::filesystem;

    /**
     * Base interface for import extractors.
     *
     * Implementations must be stateless; the scanner calls extract()
     * concurrently from worker threads.
     */
    class IImportExtractor {
    public:
        virtual ~IImportExtractor() = default;

        /**
         * Returns the language name (e.g., "python").
         */
        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /**
         * Returns the source file extensions handled (e.g., {".py"}).
         */
        [[nodiscard]] virtual std::vector<std::string> supported_extensions() const = 0;

        /**
         * File stem that marks a directory as a package ("__init__").
         */
        [[nodiscard]] virtual std::string_view package_marker() const noexcept = 0;

        /**
         * Extracts raw imports in source order, duplicates preserved.
         *
         * @param source Module source text.
         * @param origin Id of the module the source belongs to.
         * @return The imports, or a ParseFailure error.
         */
        [[nodiscard]] virtual Result<std::vector<RawImport>, Error> extract(
            std::string_view source,
            const ModuleId& origin
        ) const = 0;

        [[nodiscard]] bool can_extract(const fs::path& path) const;
    };

    /**
     * Process-wide registry of extractors, keyed by language name.
     */
    class ExtractorRegistry {
    public:
        static ExtractorRegistry& instance();

        /**
         * Registers an extractor. A second extractor with an already
         * registered name is ignored.
         */
        void register_extractor(std::unique_ptr<IImportExtractor> extractor);

        [[nodiscard]] const IImportExtractor* find_for_file(const fs::path& path) const;
        [[nodiscard]] const IImportExtractor* find_by_name(std::string_view name) const;
        [[nodiscard]] std::vector<const IImportExtractor*> list() const;

    private:
        ExtractorRegistry() = default;

        mutable std::mutex mutex_;
        std::vector<std::unique_ptr<IImportExtractor>> extractors_;
    };

    void register_python_extractor();

}  // namespace depmap::extractors

#endif //DEPMAP_EXTRACTOR_HPP
