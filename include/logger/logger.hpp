#ifndef GRIDSTORE_LOGGER_HPP
#define GRIDSTORE_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace gridstore::logging {

using severity_level = boost::log::trivial::severity_level;

// Routes BOOST_LOG_TRIVIAL output to log_file (truncated on start)
void init_logging(const std::string& log_file = "gridstore.log",
                  severity_level min_level = severity_level::info);

// Routes BOOST_LOG_TRIVIAL output to the console
void init_console_logging(severity_level min_level = severity_level::warning);

// Sets the minimum severity that reaches the sinks
void set_log_level(severity_level min_level);

void enable_logging();
void disable_logging();

} // namespace gridstore::logging

#endif // GRIDSTORE_LOGGER_HPP
