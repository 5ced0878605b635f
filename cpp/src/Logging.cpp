#include "Logging.h"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

#include "Errors.h"

using namespace ipsim;

void ipsim::initLogging(const std::string& level) {
    namespace logging = boost::log;
    logging::trivial::severity_level severity;
    if (!logging::trivial::from_string(level.c_str(), level.size(), severity))
        throw ConfigurationError("unknown log level '" + level +
                                 "' (expected trace, debug, info, warning, error or fatal)");
    logging::core::get()->set_filter(logging::trivial::severity >= severity);
}
