#ifndef VAULT_STORAGE_FILE_RECORD_HPP
#define VAULT_STORAGE_FILE_RECORD_HPP

#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace vault::storage {

// Everything here is re-derived from the filesystem on each call
struct StoredFileRecord {
  std::string stored_name;
  std::string original_name;
  std::uintmax_t size = 0;
  std::string mime_type;
  std::string category;
  std::string owner;          // empty for flat-layout files
  std::string relative_path;  // stored_name or owner/stored_name
  std::string uploaded_at;    // ISO-8601 UTC
  std::string download_url;
  std::string public_url;
};

struct CategoryStatistics {
  std::uint64_t count = 0;
  std::uintmax_t total_size = 0;
  double percentage = 0.0;  // share of the file count, two decimals
};

struct FileStatistics {
  std::uint64_t total_files = 0;
  std::uintmax_t total_size = 0;
  std::map<std::string, CategoryStatistics> file_types;
  std::map<std::string, std::uint64_t> size_breakdown;
};

void to_json(nlohmann::json& j, const StoredFileRecord& record);
void to_json(nlohmann::json& j, const CategoryStatistics& stats);
void to_json(nlohmann::json& j, const FileStatistics& stats);

} // namespace vault::storage

#endif // VAULT_STORAGE_FILE_RECORD_HPP
