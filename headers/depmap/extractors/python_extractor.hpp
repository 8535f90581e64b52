//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef DEPMAP_PYTHON_EXTRACTOR_HPP
#define DEPMAP_PYTHON_EXTRACTOR_HPP

/**
 * @file python_extractor.hpp
 * @brief Import extractor for Python sources.
 *
 * Tokenizes just enough of Python to find import statements without a
 * full grammar:
 * - comments and every string literal form (prefixes, triple quotes)
 * - logical lines (bracket nesting, backslash continuation)
 * - statement starts after newlines, `;` and block colons, so one-line
 *   bodies such as `if TYPE_CHECKING: import x` are seen
 *
 * Recognized statements:
 * @code
 *     import a.b as ab, c          ->  a.b, c                  (absolute)
 *     from pkg.mod import x, y     ->  pkg.mod.x, pkg.mod.y    (absolute)
 *     from ..core import (a, b)    ->  core.a, core.b          (relative, depth 2)
 *     from pkg import *            ->  pkg                     (star)
 * @endcode
 *
 * Unterminated strings, unbalanced brackets and malformed import
 * statements fail the whole module with ParseFailure.
 */

#include "depmap/extractors/extractor.hpp"

namespace depmap::extractors {

    class PythonImportExtractor : public IImportExtractor {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "python";
        }

        [[nodiscard]] std::vector<std::string> supported_extensions() const override {
            return {".py"};
        }

        [[nodiscard]] std::string_view package_marker() const noexcept override {
            return "__init__";
        }

        [[nodiscard]] Result<std::vector<RawImport>, Error> extract(
            std::string_view source,
            const ModuleId& origin
        ) const override;
    };

}  // namespace depmap::extractors

#endif //DEPMAP_PYTHON_EXTRACTOR_HPP
