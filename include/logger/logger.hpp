#ifndef VAULT_LOGGER_HPP
#define VAULT_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>

namespace vault::logging {

using severity_level = boost::log::trivial::severity_level;

// Log target that selects the console instead of a file
constexpr char CONSOLE_LOG_TARGET[] = "-";

// Replaces all sinks with a text file sink at `log_file`
void init_logging(const std::string& log_file);
// Replaces all sinks with a console sink on std::clog
void init_console_logging();
// Console for CONSOLE_LOG_TARGET, a log file otherwise
void init_log_target(const std::string& target);

void set_log_level(severity_level level);
// Accepts trace, debug, info, warning, error, fatal (case-insensitive)
std::optional<severity_level> parse_log_level(const std::string& name);

void enable_logging();
void disable_logging();

} // namespace vault::logging

// Convenience macros for logging
#define LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define LOG_INFO BOOST_LOG_TRIVIAL(info)
#define LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define LOG_FATAL BOOST_LOG_TRIVIAL(fatal)

#endif // VAULT_LOGGER_HPP
