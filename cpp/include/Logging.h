#pragma once
/**
 * @file Logging.h
 * @brief Runtime log level for the Boost.Log trivial logger.
 */
#include <string>

namespace ipsim {
    /**
     * @brief Only messages at `level` or above are printed.
     * @param level  trace, debug, info, warning, error or fatal
     * @throws ConfigurationError for an unknown level
     */
    void initLogging(const std::string& level);
}
