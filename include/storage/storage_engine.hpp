#pragma once

#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "storage/file_record.hpp"
#include "storage/naming.hpp"
#include "storage/path_resolver.hpp"
#include "storage/storage_error.hpp"
#include "keys/key_gate.hpp"

namespace vault {
namespace storage {

struct StorageConfig {
  std::filesystem::path root = "storage-data";
  // Static assets: /<public_prefix>/<client>/[<owner>/]<stored name>
  std::string public_prefix = "storage-data";
  // API downloads: /<download_prefix>/[<owner>/]<stored name>
  std::string download_prefix = "storage/file";
};

// Multi-tenant file store. The directory tree under the root is the only
// index: root/<client>/[<owner>/]<stored name>.
//
// No locks are taken. A list() racing a remove() may include or omit the
// removed file; both outcomes are correct.
class StorageEngine {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // `gate` may be null, in which case writes are not authorized here
  StorageEngine(StorageConfig config, std::shared_ptr<const keys::KeyGate> gate);
  StorageEngine(StorageConfig config, std::shared_ptr<const keys::KeyGate> gate,
                NameGenerator name_generator);


  // ---- CORE STORAGE OPERATIONS ----
  // Writes the stream under a freshly generated name, optionally inside an
  // owner subdirectory
  StoredFileRecord save(const std::string& client_id, const std::string& original_name,
                        std::istream& data, const std::string& mime_type,
                        const std::optional<std::string>& owner = std::nullopt);
  // Every file of the client, flat and owner-scoped. Empty when the
  // namespace does not exist yet.
  std::vector<StoredFileRecord> list(const std::string& client_id) const;
  // Physical location of a stored file
  std::filesystem::path fetch_path(const std::string& client_id, const std::string& reference) const;
  // Copies the file content to `output`, returns the byte count
  std::uintmax_t read(const std::string& client_id, const std::string& reference,
                      std::ostream& output) const;
  // Metadata of a single file, reported with its owner/file shape even when
  // looked up by bare file name
  StoredFileRecord info(const std::string& client_id, const std::string& reference) const;
  void remove(const std::string& client_id, const std::string& reference);


  // ---- QUERY OPERATIONS ----
  bool exists(const std::string& client_id, const std::string& reference) const;
  FileStatistics statistics(const std::string& client_id) const;

  const StorageConfig& config() const { return config_; }
  const PathResolver& resolver() const { return resolver_; }

private:
  // ---- PARAMETERS ----
  StorageConfig config_;
  std::shared_ptr<const keys::KeyGate> gate_;
  PathResolver resolver_;
  NameGenerator name_generator_;


  // ---- RECORD SUPPORT ----
  // Stats `physical_path` and fills every derivable field
  StoredFileRecord build_record(const std::string& client_id, const std::string& owner,
                                const std::filesystem::path& physical_path) const;
  std::string public_url(const std::string& client_id, const std::string& relative_path) const;
  std::string download_url(const std::string& relative_path) const;
  // Appends the regular files directly inside `dir`. Hidden entries and
  // files deleted mid-scan are skipped.
  void collect_files(const std::string& client_id, const std::string& owner,
                     const std::filesystem::path& dir, std::vector<StoredFileRecord>& out) const;


  // ---- WRITE SUPPORT ----
  void authorize(const std::string& client_id) const;
  // Creates the directory if needed; an existing directory is fine
  void ensure_directory(const std::filesystem::path& dir) const;
  // Streams into a hidden temp file and renames it into place
  void write_atomically(const std::filesystem::path& target, std::istream& data) const;
};

} // namespace storage
} // namespace vault
