//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef DEPMAP_STDLIB_TABLE_HPP
#define DEPMAP_STDLIB_TABLE_HPP

/**
 * @file stdlib_table.hpp
 * @brief Standard-library classification table.
 *
 * Membership is decided on the first component of an import target
 * ("os" for "os.path"). The table is plain data injected into the
 * resolver; configuration may extend it with extra names.
 */

#include <string>
#include <string_view>
#include <vector>
#include <unordered_set>

namespace depmap::resolve {

    class StdlibTable {
    public:
        StdlibTable() = default;
        explicit StdlibTable(std::unordered_set<std::string> names);

        /**
         * Table of Python 3 standard-library top-level modules.
         */
        [[nodiscard]] static StdlibTable python();

        void add(std::string name);
        void add_all(const std::vector<std::string>& names);

        /**
         * True when the first component of a dotted name is a
         * standard-library module.
         */
        [[nodiscard]] bool contains(std::string_view dotted) const;

        [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }

    private:
        std::unordered_set<std::string> names_;
    };

}  // namespace depmap::resolve

#endif //DEPMAP_STDLIB_TABLE_HPP
