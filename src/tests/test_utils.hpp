#ifndef VAULT_TEST_UTILS_HPP
#define VAULT_TEST_UTILS_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <gmock/gmock.h>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include "keys/key_gate.hpp"

// Console logging at warning level so test output stays readable
inline void init_test_logging() {
  boost::log::core::get()->remove_all_sinks();
  boost::log::add_console_log(
    std::clog,
    boost::log::keywords::format = "[%TimeStamp%] [%ThreadID%] %Message%",
    boost::log::keywords::auto_flush = true
  );
  boost::log::core::get()->set_filter(
    boost::log::trivial::severity >= boost::log::trivial::warning
  );
  boost::log::core::get()->set_logging_enabled(true);
  boost::log::add_common_attributes();
}

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
  explicit TempDir(const std::string& prefix) {
    static std::atomic<unsigned> counter{0};
    path_ = std::filesystem::temp_directory_path() /
      (prefix + "_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) +
       "_" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream file(path, std::ios::binary);
  file << content;
}

inline std::string read_file(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

class MockKeyGate : public vault::keys::KeyGate {
public:
  MOCK_METHOD(bool, is_authorized, (const std::string& key), (const, override));
};

#endif // VAULT_TEST_UTILS_HPP
