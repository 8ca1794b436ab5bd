#include "utils/time_format.hpp"
#include <iomanip>
#include <sstream>

namespace vault::utils {

namespace {

std::string format_utc(std::chrono::system_clock::time_point tp,
                       const char* date_time_format, char millis_separator) {
  const auto since_epoch = tp.time_since_epoch();
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - seconds).count();
  // Pre-epoch instants floor towards the previous second
  if (millis < 0) {
    millis += 1000;
    seconds -= std::chrono::seconds(1);
  }

  std::time_t raw = static_cast<std::time_t>(seconds.count());
  std::tm utc{};
  gmtime_r(&raw, &utc);

  std::ostringstream ss;
  ss << std::put_time(&utc, date_time_format)
     << millis_separator << std::setw(3) << std::setfill('0') << millis << 'Z';
  return ss.str();
}

} // namespace

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
  return format_utc(tp, "%Y-%m-%dT%H:%M:%S", '.');
}

std::string format_path_timestamp(std::chrono::system_clock::time_point tp) {
  return format_utc(tp, "%Y-%m-%dT%H-%M-%S", '-');
}

std::chrono::system_clock::time_point from_timespec(const struct timespec& ts) {
  auto duration = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
  return std::chrono::system_clock::time_point(
    std::chrono::duration_cast<std::chrono::system_clock::duration>(duration));
}

} // namespace vault::utils
