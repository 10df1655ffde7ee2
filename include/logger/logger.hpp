#ifndef BACKUPER_LOGGER_HPP
#define BACKUPER_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace backuper {
namespace logging {

// Severity threshold for the console: debug with --debug, warning otherwise
boost::log::trivial::severity_level threshold_for(bool debug);

// Replaces all sinks with a console sink on std::clog and, when log_file
// is not empty, a file sink appending to log_file. Both use the format
//   2024-01-01 12:00:00.000000 [info] Component: message
void init_logging(bool debug, const std::string& log_file = "");

} // namespace logging
} // namespace backuper

#endif // BACKUPER_LOGGER_HPP
