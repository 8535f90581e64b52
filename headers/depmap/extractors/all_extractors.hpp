//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef DEPMAP_ALL_EXTRACTORS_HPP
#define DEPMAP_ALL_EXTRACTORS_HPP

/**
 * @file all_extractors.hpp
 * @brief Registers every built-in import extractor.
 */

#include "depmap/extractors/python_extractor.hpp"

namespace depmap::extractors {

    /**
     * Registers all built-in extractors with the global registry.
     * Safe to call more than once.
     */
    inline void register_all_extractors() {
        register_python_extractor();
    }

}  // namespace depmap::extractors

#endif //DEPMAP_ALL_EXTRACTORS_HPP
