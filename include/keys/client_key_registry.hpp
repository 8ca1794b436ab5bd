#ifndef VAULT_KEYS_CLIENT_KEY_REGISTRY_HPP
#define VAULT_KEYS_CLIENT_KEY_REGISTRY_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "keys/key_gate.hpp"

namespace vault::keys {

constexpr std::size_t CLIENT_KEY_BYTES = 32;  // 64 hex characters

struct ClientKeyRecord {
  std::int64_t id = 0;
  std::string key;
  std::string name;
  bool is_active = true;
  std::optional<std::string> revoked_at;
  std::optional<std::string> note;
  std::string created_at;
  std::string updated_at;
};

// Partial update; unset fields are left alone
struct ClientKeyPatch {
  std::optional<std::string> name;
  std::optional<bool> is_active;
  std::optional<std::string> note;
};

void to_json(nlohmann::json& j, const ClientKeyRecord& record);
void from_json(const nlohmann::json& j, ClientKeyRecord& record);

// Client keys persisted as a JSON array in a single file. Every call reads
// the file afresh, so edits made by another process are picked up.
class ClientKeyRegistry : public KeyGate {
public:
  // ---- CONSTRUCTOR ----
  explicit ClientKeyRegistry(std::filesystem::path store_file);


  // ---- KEY LIFECYCLE ----
  ClientKeyRecord create(const std::string& name, const std::optional<std::string>& note = std::nullopt);
  std::optional<ClientKeyRecord> update(std::int64_t id, const ClientKeyPatch& patch);
  // Deactivates the key and stamps revoked_at
  std::optional<ClientKeyRecord> revoke(std::int64_t id);
  // Issues a new key and reactivates the record
  std::optional<ClientKeyRecord> rotate(std::int64_t id);
  bool remove(std::int64_t id);


  // ---- QUERY OPERATIONS ----
  std::vector<ClientKeyRecord> find_all() const;
  std::optional<ClientKeyRecord> find_one(std::int64_t id) const;
  bool validate_key(const std::string& key) const;

  bool is_authorized(const std::string& key) const override { return validate_key(key); }

  const std::filesystem::path& store_file() const { return store_file_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path store_file_;
  mutable std::mutex mutex_;


  // ---- PERSISTENCE ----
  // Missing, unreadable or corrupt files read as an empty registry
  std::vector<ClientKeyRecord> read_all() const;
  void write_all(const std::vector<ClientKeyRecord>& records) const;
  // Applies `mutate` to the record with `id` and persists the result
  std::optional<ClientKeyRecord> modify(std::int64_t id,
                                        const std::function<void(ClientKeyRecord&)>& mutate);
  static std::string generate_key();
};

} // namespace vault::keys

#endif // VAULT_KEYS_CLIENT_KEY_REGISTRY_HPP
