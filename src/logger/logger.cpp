#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace sevault::logging {

namespace {

namespace expr = boost::log::expressions;
namespace sinks = boost::log::sinks;

// Shared by the file and console sinks
auto make_formatter() {
  return expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << boost::log::trivial::severity << "] "
      << expr::smessage;
}

} // namespace

void init_logging(const std::string& log_file, boost::log::trivial::severity_level min_level, bool console) {
  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    auto backend = boost::make_shared<sinks::text_file_backend>();
    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    backend->set_file_name_pattern(log_path.string());
    backend->set_open_mode(std::ios::out | std::ios::app);
    backend->auto_flush(true);

    using file_sink = sinks::synchronous_sink<sinks::text_file_backend>;
    auto sink = boost::make_shared<file_sink>(backend);
    sink->set_formatter(make_formatter());
    boost::log::core::get()->add_sink(sink);

    if (console) {
      auto console_backend = boost::make_shared<sinks::text_ostream_backend>();
      console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      console_backend->auto_flush(true);

      using console_sink = sinks::synchronous_sink<sinks::text_ostream_backend>;
      auto stream_sink = boost::make_shared<console_sink>(console_backend);
      stream_sink->set_formatter(make_formatter());
      boost::log::core::get()->add_sink(stream_sink);
    }

    boost::log::add_common_attributes();
    set_log_level(min_level);
    boost::log::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(info) << "Logger: Writing to " << log_path.string() << " at level " << min_level;
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(boost::log::trivial::severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

boost::log::trivial::severity_level parse_severity(const std::string& name) {
  boost::log::trivial::severity_level level;
  if (!boost::log::trivial::from_string(name.c_str(), name.size(), level)) {
    throw std::invalid_argument("Unknown log level: " + name);
  }
  return level;
}

} // namespace sevault::logging
