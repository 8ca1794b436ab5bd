#ifndef VAULT_UTILS_TIME_FORMAT_HPP
#define VAULT_UTILS_TIME_FORMAT_HPP

#include <chrono>
#include <ctime>
#include <string>

namespace vault::utils {

// ISO-8601 UTC with milliseconds: 2026-10-19T18:48:00.123Z
std::string format_iso8601(std::chrono::system_clock::time_point tp);

// Same instant with ':' and '.' replaced by '-' so it can sit in a filename
std::string format_path_timestamp(std::chrono::system_clock::time_point tp);

// Converts a POSIX timespec (as found in struct stat) to a system_clock point
std::chrono::system_clock::time_point from_timespec(const struct timespec& ts);

} // namespace vault::utils

#endif // VAULT_UTILS_TIME_FORMAT_HPP
