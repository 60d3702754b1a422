#ifndef SEVAULT_LOGGER_HPP
#define SEVAULT_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace sevault::logging {

// Installs a synchronous file sink (and optionally a console sink) and sets
// the global severity filter. Replaces any sinks installed before.
void init_logging(const std::string& log_file,
                  boost::log::trivial::severity_level min_level = boost::log::trivial::info,
                  bool console = false);

// Changes the global severity filter without touching the sinks
void set_log_level(boost::log::trivial::severity_level min_level);

// "trace", "debug", "info", "warning", "error", "fatal".
// Throws std::invalid_argument for anything else.
boost::log::trivial::severity_level parse_severity(const std::string& name);

} // namespace sevault::logging

#endif // SEVAULT_LOGGER_HPP
