//
// Created by gregorian-rayne on 1/19/26.
//

#ifndef DEPMAP_SOURCE_WALKER_HPP
#define DEPMAP_SOURCE_WALKER_HPP

/**
 * @file source_walker.hpp
 * @brief Discovery of source files under a scan root.
 */

#include "depmap/result.hpp"
#include "depmap/error.hpp"
#include "depmap/types.hpp"

#include <string>
#include <vector>

namespace depmap::scanner {

    /**
     * Directory names skipped unless the caller supplies its own list.
     */
    [[nodiscard]] const std::vector<std::string>& default_excludes();

    /**
     * Recursively lists the files under root whose extension is in
     * extensions, sorted by path.
     *
     * A directory is skipped when its name, or its path relative to root
     * ("tests/fixtures"), appears in excludes. Unreadable directories are
     * skipped silently.
     *
     * @return InvalidArgument when root is not a directory, IoError when
     *         the walk itself fails.
     */
    [[nodiscard]] Result<std::vector<fs::path>, Error> collect_source_files(
        const fs::path& root,
        const std::vector<std::string>& extensions,
        const std::vector<std::string>& excludes
    );

}  // namespace depmap::scanner

#endif //DEPMAP_SOURCE_WALKER_HPP
