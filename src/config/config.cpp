#include "config/config.hpp"
#include <cstdlib>

namespace vault::config {

namespace {

// Strips surrounding slashes so URL templates do not double them
std::string normalize_prefix(const std::string& prefix, const char* variable) {
  std::size_t first = prefix.find_first_not_of('/');
  if (first == std::string::npos) {
    throw ConfigError(std::string(variable) + " must not be empty");
  }
  std::size_t last = prefix.find_last_not_of('/');
  return prefix.substr(first, last - first + 1);
}

} // namespace

std::filesystem::path AppConfig::effective_keys_file() const {
  if (!keys_file.empty()) {
    return keys_file;
  }
  return (std::filesystem::absolute(storage_root) / ".." / "client-keys.json").lexically_normal();
}

storage::StorageConfig AppConfig::storage_config() const {
  storage::StorageConfig config;
  config.root = storage_root;
  config.public_prefix = public_prefix;
  config.download_prefix = download_prefix;
  return config;
}

AppConfig from_environment(const EnvLookup& lookup) {
  AppConfig config;

  if (auto root = lookup("STORAGE_ROOT")) {
    if (root->empty()) {
      throw ConfigError("STORAGE_ROOT must not be empty");
    }
    config.storage_root = *root;
  }
  if (auto prefix = lookup("STORAGE_PUBLIC_PREFIX")) {
    config.public_prefix = normalize_prefix(*prefix, "STORAGE_PUBLIC_PREFIX");
  }
  if (auto prefix = lookup("STORAGE_DOWNLOAD_PREFIX")) {
    config.download_prefix = normalize_prefix(*prefix, "STORAGE_DOWNLOAD_PREFIX");
  }
  if (auto keys = lookup("CLIENT_KEYS_FILE"); keys && !keys->empty()) {
    config.keys_file = *keys;
  }
  if (auto log_file = lookup("LOG_FILE"); log_file && !log_file->empty()) {
    config.log_file = *log_file;
  }
  if (auto level = lookup("LOG_LEVEL")) {
    auto parsed = logging::parse_log_level(*level);
    if (!parsed) {
      throw ConfigError("Invalid LOG_LEVEL: " + *level);
    }
    config.log_level = *parsed;
  }

  return config;
}

AppConfig from_environment() {
  return from_environment(process_env);
}

std::optional<std::string> process_env(const std::string& name) {
  if (const char* value = std::getenv(name.c_str())) {
    return std::string(value);
  }
  return std::nullopt;
}

} // namespace vault::config
