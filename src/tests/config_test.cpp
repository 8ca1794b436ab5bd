#include <gtest/gtest.h>
#include <map>
#include "config/config.hpp"

using namespace vault::config;

namespace {

EnvLookup env_of(std::map<std::string, std::string> values) {
  return [values](const std::string& name) -> std::optional<std::string> {
    auto it = values.find(name);
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

} // namespace

TEST(ConfigTest, DefaultsWhenEnvironmentIsEmpty) {
  AppConfig config = from_environment(env_of({}));

  EXPECT_EQ(config.storage_root.string(), "storage-data");
  EXPECT_EQ(config.public_prefix, "storage-data");
  EXPECT_EQ(config.download_prefix, "storage/file");
  EXPECT_EQ(config.log_file, "vault.log");
  EXPECT_EQ(config.log_level, boost::log::trivial::info);
  EXPECT_EQ(config.effective_keys_file().filename().string(), "client-keys.json");
  EXPECT_EQ(config.effective_keys_file().parent_path().string(), std::filesystem::current_path().string());
}

TEST(ConfigTest, ReadsAllVariables) {
  AppConfig config = from_environment(env_of({
    {"STORAGE_ROOT", "/srv/vault/data"},
    {"STORAGE_PUBLIC_PREFIX", "/static/"},
    {"STORAGE_DOWNLOAD_PREFIX", "api/files"},
    {"CLIENT_KEYS_FILE", "/etc/vault/keys.json"},
    {"LOG_FILE", "/var/log/vault.log"},
    {"LOG_LEVEL", "DEBUG"}
  }));

  EXPECT_EQ(config.storage_root.string(), "/srv/vault/data");
  EXPECT_EQ(config.public_prefix, "static");
  EXPECT_EQ(config.download_prefix, "api/files");
  EXPECT_EQ(config.effective_keys_file().string(), "/etc/vault/keys.json");
  EXPECT_EQ(config.log_file, "/var/log/vault.log");
  EXPECT_EQ(config.log_level, boost::log::trivial::debug);

  auto storage = config.storage_config();
  EXPECT_EQ(storage.root.string(), "/srv/vault/data");
  EXPECT_EQ(storage.public_prefix, "static");
  EXPECT_EQ(storage.download_prefix, "api/files");
}

TEST(ConfigTest, KeysFileDefaultsBesideStorageRoot) {
  AppConfig config = from_environment(env_of({{"STORAGE_ROOT", "/srv/vault/data"}}));
  EXPECT_EQ(config.effective_keys_file().string(), "/srv/vault/client-keys.json");
}

TEST(ConfigTest, RejectsInvalidValues) {
  EXPECT_THROW(from_environment(env_of({{"LOG_LEVEL", "loud"}})), ConfigError);
  EXPECT_THROW(from_environment(env_of({{"STORAGE_ROOT", ""}})), ConfigError);
  EXPECT_THROW(from_environment(env_of({{"STORAGE_PUBLIC_PREFIX", "//"}})), ConfigError);
}
