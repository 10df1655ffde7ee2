#include "logger/logger.hpp"
#include <filesystem>
#include <iostream>
#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

namespace backuper {
namespace logging {

namespace {

namespace expr = boost::log::expressions;
namespace sinks = boost::log::sinks;

auto line_format() {
  return expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << boost::log::trivial::severity << "] "
      << expr::smessage;
}

void add_console_sink() {
  auto backend = boost::make_shared<sinks::text_ostream_backend>();
  backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  backend->auto_flush(true);

  using console_sink = sinks::synchronous_sink<sinks::text_ostream_backend>;
  auto sink = boost::make_shared<console_sink>(backend);
  sink->set_formatter(line_format());
  boost::log::core::get()->add_sink(sink);
}

void add_file_sink(const std::string& log_file) {
  auto backend = boost::make_shared<sinks::text_file_backend>();

  // Convert to absolute path
  std::filesystem::path log_path = std::filesystem::absolute(log_file);
  backend->set_file_name_pattern(log_path.string());
  backend->set_open_mode(std::ios::out | std::ios::app);
  backend->auto_flush(true);

  using file_sink = sinks::synchronous_sink<sinks::text_file_backend>;
  auto sink = boost::make_shared<file_sink>(backend);
  sink->set_formatter(line_format());
  boost::log::core::get()->add_sink(sink);
}

} // namespace

boost::log::trivial::severity_level threshold_for(bool debug) {
  return debug ? boost::log::trivial::debug : boost::log::trivial::warning;
}

void init_logging(bool debug, const std::string& log_file) {
  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();
    boost::log::add_common_attributes();

    add_console_sink();
    if (!log_file.empty()) {
      add_file_sink(log_file);
    }

    boost::log::core::get()->set_filter(boost::log::trivial::severity >= threshold_for(debug));
    boost::log::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(debug) << "Logger: Debug logging enabled"
                             << (log_file.empty() ? "" : ", writing to " + log_file);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

} // namespace logging
} // namespace backuper
