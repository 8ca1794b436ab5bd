#include "keys/client_key_registry.hpp"
#include "storage/storage_error.hpp"
#include "utils/encoding.hpp"
#include "utils/time_format.hpp"
#include <algorithm>
#include <fstream>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace vault::keys {

namespace fs = std::filesystem;

namespace {

std::string now_iso8601() {
  return utils::format_iso8601(std::chrono::system_clock::now());
}

nlohmann::json optional_to_json(const std::optional<std::string>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<std::string> optional_from_json(const nlohmann::json& j, const char* field) {
  auto it = j.find(field);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

} // namespace

//==============================================
// JSON MAPPING
//==============================================

void to_json(nlohmann::json& j, const ClientKeyRecord& record) {
  j = nlohmann::json{
    {"id", record.id},
    {"key", record.key},
    {"name", record.name},
    {"isActive", record.is_active},
    {"revokedAt", optional_to_json(record.revoked_at)},
    {"note", optional_to_json(record.note)},
    {"createdAt", record.created_at},
    {"updatedAt", record.updated_at}
  };
}

void from_json(const nlohmann::json& j, ClientKeyRecord& record) {
  j.at("id").get_to(record.id);
  j.at("key").get_to(record.key);
  j.at("name").get_to(record.name);
  record.is_active = j.value("isActive", false);
  record.revoked_at = optional_from_json(j, "revokedAt");
  record.note = optional_from_json(j, "note");
  record.created_at = j.value("createdAt", std::string());
  record.updated_at = j.value("updatedAt", std::string());
}


//==============================================
// CONSTRUCTOR
//==============================================

ClientKeyRegistry::ClientKeyRegistry(fs::path store_file) : store_file_(std::move(store_file)) {
  BOOST_LOG_TRIVIAL(info) << "ClientKeyRegistry: Using store file " << store_file_.string();
}


//==============================================
// KEY LIFECYCLE
//==============================================

ClientKeyRecord ClientKeyRegistry::create(const std::string& name, const std::optional<std::string>& note) {
  if (name.empty()) {
    throw storage::InvalidArgumentError("Client key name is required");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ClientKeyRecord> records = read_all();

  std::int64_t next_id = 1;
  for (const auto& record : records) {
    next_id = std::max(next_id, record.id + 1);
  }

  ClientKeyRecord record;
  record.id = next_id;
  record.key = generate_key();
  record.name = name;
  record.is_active = true;
  record.note = note;
  record.created_at = now_iso8601();
  record.updated_at = record.created_at;

  // Newest first
  records.insert(records.begin(), record);
  write_all(records);

  BOOST_LOG_TRIVIAL(info) << "ClientKeyRegistry: Created key " << record.id << " for " << name;
  return record;
}

std::optional<ClientKeyRecord> ClientKeyRegistry::update(std::int64_t id, const ClientKeyPatch& patch) {
  if (patch.name && patch.name->empty()) {
    throw storage::InvalidArgumentError("Client key name is required");
  }
  return modify(id, [&patch](ClientKeyRecord& record) {
    if (patch.name) record.name = *patch.name;
    if (patch.is_active) record.is_active = *patch.is_active;
    if (patch.note) record.note = *patch.note;
  });
}

std::optional<ClientKeyRecord> ClientKeyRegistry::revoke(std::int64_t id) {
  return modify(id, [](ClientKeyRecord& record) {
    record.is_active = false;
    record.revoked_at = now_iso8601();
  });
}

std::optional<ClientKeyRecord> ClientKeyRegistry::rotate(std::int64_t id) {
  return modify(id, [](ClientKeyRecord& record) {
    record.key = generate_key();
    record.is_active = true;
    record.revoked_at.reset();
  });
}

bool ClientKeyRegistry::remove(std::int64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ClientKeyRecord> records = read_all();

  auto it = std::remove_if(records.begin(), records.end(),
                           [id](const ClientKeyRecord& record) { return record.id == id; });
  if (it == records.end()) {
    BOOST_LOG_TRIVIAL(info) << "ClientKeyRegistry: No key " << id << " to remove";
    return false;
  }

  records.erase(it, records.end());
  write_all(records);
  BOOST_LOG_TRIVIAL(info) << "ClientKeyRegistry: Removed key " << id;
  return true;
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::vector<ClientKeyRecord> ClientKeyRegistry::find_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return read_all();
}

std::optional<ClientKeyRecord> ClientKeyRegistry::find_one(std::int64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& record : read_all()) {
    if (record.id == id) {
      return record;
    }
  }
  return std::nullopt;
}

bool ClientKeyRegistry::validate_key(const std::string& key) const {
  if (key.empty()) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const std::vector<ClientKeyRecord> records = read_all();
  bool valid = std::any_of(records.begin(), records.end(), [&key](const ClientKeyRecord& record) {
    return record.key == key && record.is_active;
  });

  BOOST_LOG_TRIVIAL(debug) << "ClientKeyRegistry: Key validation " << (valid ? "passed" : "failed");
  return valid;
}


//==============================================
// PERSISTENCE
//==============================================

std::vector<ClientKeyRecord> ClientKeyRegistry::read_all() const {
  std::ifstream file(store_file_);
  if (!file) {
    return {};
  }

  try {
    nlohmann::json j = nlohmann::json::parse(file);
    if (!j.is_array()) {
      BOOST_LOG_TRIVIAL(warning) << "ClientKeyRegistry: Store file is not a JSON array, ignoring it";
      return {};
    }
    return j.get<std::vector<ClientKeyRecord>>();
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "ClientKeyRegistry: Failed to parse store file: " << e.what();
    return {};
  }
}

void ClientKeyRegistry::write_all(const std::vector<ClientKeyRecord>& records) const {
  std::error_code ec;
  if (store_file_.has_parent_path()) {
    fs::create_directories(store_file_.parent_path(), ec);
    std::error_code check_ec;
    if (ec && !fs::is_directory(store_file_.parent_path(), check_ec)) {
      BOOST_LOG_TRIVIAL(error) << "ClientKeyRegistry: Failed to create " << store_file_.parent_path().string()
                               << ": " << ec.message();
      throw storage::FaultError("Failed to persist client keys");
    }
  }

  const fs::path temp_path = fs::path(store_file_).concat(".tmp");
  {
    std::ofstream file(temp_path, std::ios::trunc);
    if (!file) {
      BOOST_LOG_TRIVIAL(error) << "ClientKeyRegistry: Failed to open " << temp_path.string();
      throw storage::FaultError("Failed to persist client keys");
    }
    file << nlohmann::json(records).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    if (!file) {
      BOOST_LOG_TRIVIAL(error) << "ClientKeyRegistry: Failed to write " << temp_path.string();
      throw storage::FaultError("Failed to persist client keys");
    }
  }

  fs::rename(temp_path, store_file_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "ClientKeyRegistry: Failed to replace store file: " << ec.message();
    throw storage::FaultError("Failed to persist client keys");
  }
}

std::optional<ClientKeyRecord> ClientKeyRegistry::modify(std::int64_t id,
                                                         const std::function<void(ClientKeyRecord&)>& mutate) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ClientKeyRecord> records = read_all();

  auto it = std::find_if(records.begin(), records.end(),
                         [id](const ClientKeyRecord& record) { return record.id == id; });
  if (it == records.end()) {
    BOOST_LOG_TRIVIAL(info) << "ClientKeyRegistry: No key with id " << id;
    return std::nullopt;
  }

  mutate(*it);
  it->updated_at = now_iso8601();
  write_all(records);

  BOOST_LOG_TRIVIAL(info) << "ClientKeyRegistry: Updated key " << id;
  return *it;
}

std::string ClientKeyRegistry::generate_key() {
  try {
    return utils::random_hex(CLIENT_KEY_BYTES);
  } catch (const std::runtime_error&) {
    throw storage::FaultError("Failed to generate client key");
  }
}

} // namespace vault::keys
