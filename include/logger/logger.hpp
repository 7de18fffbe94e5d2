#ifndef CHUNKLINE_LOGGER_HPP
#define CHUNKLINE_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace chunkline::logging {

using severity_level = boost::log::trivial::severity_level;

// Replaces all sinks with a text file sink at `log_file` (truncated).
// Components keep logging through BOOST_LOG_TRIVIAL.
void init_logging(const std::string& log_file = "chunkline.log",
                  severity_level min_level = boost::log::trivial::info);

// Replaces all sinks with a console sink on stderr
void init_console_logging(severity_level min_level = boost::log::trivial::info);

// Changes the minimum severity that reaches the sinks
void set_log_level(severity_level min_level);

// Parses "trace", "debug", "info", "warning", "error" or "fatal".
// Returns false and leaves `level` untouched on unknown names.
bool parse_log_level(const std::string& name, severity_level& level);

} // namespace chunkline::logging

#endif // CHUNKLINE_LOGGER_HPP
