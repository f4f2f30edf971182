//
// Created by gregorian-rayne on 10/2/26.
//

#ifndef CRASHTESTAUDIT_VERSION_HPP
#define CRASHTESTAUDIT_VERSION_HPP

/**
 * @file version.hpp
 * @brief Crash Test Audit version information.
 */

namespace cta {

    constexpr int VERSION_MAJOR = 0;
    constexpr int VERSION_MINOR = 3;
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "0.3.0";

    constexpr auto PROJECT_NAME = "Crash Test Audit";

    /**
     * Short project name for CLI usage and the HTTP User-Agent.
     */
    constexpr auto PROJECT_SHORT_NAME = "cta";

}  // namespace cta

#endif //CRASHTESTAUDIT_VERSION_HPP
