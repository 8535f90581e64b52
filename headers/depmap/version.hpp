//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef DEPMAP_VERSION_HPP
#define DEPMAP_VERSION_HPP

/**
 * @file version.hpp
 * @brief depmap version information.
 */

namespace depmap {

    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "1.0.0";

    /**
     * Project name used in report headers and footers.
     */
    constexpr auto PROJECT_NAME = "DepMap";

    /**
     * Executable name.
     */
    constexpr auto PROJECT_SHORT_NAME = "depmap";

}  // namespace depmap

#endif //DEPMAP_VERSION_HPP
