#include "logger/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace vault::logging {

namespace {

namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

// Shared by every sink
const auto& log_format() {
  static const auto format =
    expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << boost::log::trivial::severity << "]"
      << " [Thread " << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "]"
      << " " << expr::smessage;
  return format;
}

} // namespace

void init_logging(const std::string& log_file) {
  try {
    boost::log::core::get()->remove_all_sinks();

    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    if (log_path.has_parent_path()) {
      std::filesystem::create_directories(log_path.parent_path());
    }

    boost::log::add_file_log(
      keywords::file_name = log_path.string(),
      keywords::open_mode = std::ios::out | std::ios::app,
      keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
      keywords::auto_flush = true,
      keywords::format = log_format()
    );

    boost::log::add_common_attributes();
    boost::log::core::get()->set_logging_enabled(true);
    set_log_level(boost::log::trivial::info);

    BOOST_LOG_TRIVIAL(info) << "Logging system initialized with file: " << log_path.string();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void init_console_logging() {
  boost::log::core::get()->remove_all_sinks();
  boost::log::add_console_log(
    std::clog,
    keywords::auto_flush = true,
    keywords::format = log_format()
  );
  boost::log::add_common_attributes();
  boost::log::core::get()->set_logging_enabled(true);
  set_log_level(boost::log::trivial::info);

  BOOST_LOG_TRIVIAL(info) << "Logging system initialized on console";
}

void init_log_target(const std::string& target) {
  if (target == CONSOLE_LOG_TARGET) {
    init_console_logging();
  } else {
    init_logging(target);
  }
}

void set_log_level(severity_level level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

std::optional<severity_level> parse_log_level(const std::string& name) {
  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "warn") {
    lowered = "warning";
  }

  severity_level level;
  if (boost::log::trivial::from_string(lowered.c_str(), lowered.size(), level)) {
    return level;
  }
  return std::nullopt;
}

void enable_logging() {
  boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  boost::log::core::get()->set_logging_enabled(false);
}

} // namespace vault::logging
