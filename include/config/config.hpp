#ifndef VAULT_CONFIG_HPP
#define VAULT_CONFIG_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include "logger/logger.hpp"
#include "storage/storage_engine.hpp"

namespace vault::config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct AppConfig {
  std::filesystem::path storage_root = "storage-data";
  std::string public_prefix = "storage-data";
  std::string download_prefix = "storage/file";
  // Defaults to <storage_root>/../client-keys.json when empty
  std::filesystem::path keys_file;
  std::string log_file = "vault.log";  // "-" logs to the console
  logging::severity_level log_level = logging::severity_level::info;

  // Keys file with the default applied
  std::filesystem::path effective_keys_file() const;
  storage::StorageConfig storage_config() const;
};

// Looks a variable up; nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads STORAGE_ROOT, STORAGE_PUBLIC_PREFIX, STORAGE_DOWNLOAD_PREFIX,
// CLIENT_KEYS_FILE, LOG_FILE and LOG_LEVEL. Throws ConfigError on bad values.
AppConfig from_environment(const EnvLookup& lookup);
AppConfig from_environment();

// Process environment lookup via std::getenv
std::optional<std::string> process_env(const std::string& name);

} // namespace vault::config

#endif // VAULT_CONFIG_HPP
