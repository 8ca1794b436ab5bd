#include "storage/storage_engine.hpp"
#include "storage/mime_types.hpp"
#include "utils/encoding.hpp"
#include "utils/time_format.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>
#include <system_error>
#include <sys/stat.h>
#include <boost/log/trivial.hpp>

namespace vault {
namespace storage {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t COPY_BUFFER_SIZE = 4096;

constexpr char TEMP_PREFIX[] = ".";
constexpr char TEMP_SUFFIX[] = ".part";

bool is_hidden(const fs::path& path) {
  const std::string name = path.filename().string();
  return !name.empty() && name.front() == '.';
}

// In-flight upload written by write_atomically
bool is_temp_file(const fs::path& path) {
  const std::string name = path.filename().string();
  const std::string suffix = TEMP_SUFFIX;
  return name.size() > suffix.size() && name.rfind(TEMP_PREFIX, 0) == 0 &&
         name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

double round_percentage(std::uint64_t part, std::uint64_t total) {
  double percentage = static_cast<double>(part) * 100.0 / static_cast<double>(total);
  return std::round(percentage * 100.0) / 100.0;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

StorageEngine::StorageEngine(StorageConfig config, std::shared_ptr<const keys::KeyGate> gate)
  : StorageEngine(std::move(config), std::move(gate), NameGenerator()) {}

StorageEngine::StorageEngine(StorageConfig config, std::shared_ptr<const keys::KeyGate> gate,
                             NameGenerator name_generator)
  : config_(std::move(config))
  , gate_(std::move(gate))
  , resolver_(config_.root)
  , name_generator_(std::move(name_generator)) {
  BOOST_LOG_TRIVIAL(info) << "StorageEngine: Initializing with root: " << resolver_.root().string();
  ensure_directory(resolver_.root());
  if (!gate_) {
    BOOST_LOG_TRIVIAL(warning) << "StorageEngine: No key gate configured, writes are not authorized";
  }
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

StoredFileRecord StorageEngine::save(const std::string& client_id, const std::string& original_name,
                                     std::istream& data, const std::string& mime_type,
                                     const std::optional<std::string>& owner) {
  BOOST_LOG_TRIVIAL(info) << "StorageEngine: Saving " << original_name << " for client " << client_id
                          << (owner && !owner->empty() ? " owner " + *owner : std::string());
  authorize(client_id);

  if (!data.good()) {
    BOOST_LOG_TRIVIAL(error) << "StorageEngine: Invalid input stream for " << original_name;
    throw InvalidArgumentError("Invalid input stream");
  }

  const bool has_owner = owner && !owner->empty();
  const fs::path target_dir = has_owner ? resolver_.owner_root(client_id, *owner)
                                        : resolver_.client_root(client_id);
  const std::string stored_name = name_generator_.generate(original_name);

  ensure_directory(target_dir);
  const fs::path target = target_dir / stored_name;
  write_atomically(target, data);

  StoredFileRecord record = build_record(client_id, has_owner ? *owner : std::string(), target);
  if (!mime_type.empty()) {
    record.mime_type = mime_type;
    record.category = category_for(mime_type);
  }

  BOOST_LOG_TRIVIAL(info) << "StorageEngine: Stored " << record.size << " bytes as " << record.relative_path;
  return record;
}

std::vector<StoredFileRecord> StorageEngine::list(const std::string& client_id) const {
  BOOST_LOG_TRIVIAL(info) << "StorageEngine: Listing files for client " << client_id;

  std::vector<StoredFileRecord> records;
  const fs::path client_dir = resolver_.client_root(client_id);

  std::error_code ec;
  if (!fs::is_directory(client_dir, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "StorageEngine: No namespace yet for client " << client_id;
    return records;
  }

  collect_files(client_id, "", client_dir, records);

  // Owner subdirectories, one level only
  for (fs::directory_iterator it(client_dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_directory(type_ec) || is_hidden(it->path())) {
      continue;
    }
    collect_files(client_id, it->path().filename().string(), it->path(), records);
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "StorageEngine: Failed to scan " << client_dir.string() << ": " << ec.message();
    throw FaultError("Failed to list files");
  }

  std::sort(records.begin(), records.end(), [](const StoredFileRecord& a, const StoredFileRecord& b) {
    if (a.stored_name != b.stored_name) {
      return a.stored_name < b.stored_name;
    }
    return a.relative_path < b.relative_path;
  });

  BOOST_LOG_TRIVIAL(info) << "StorageEngine: Found " << records.size() << " files for client " << client_id;
  return records;
}

fs::path StorageEngine::fetch_path(const std::string& client_id, const std::string& reference) const {
  BOOST_LOG_TRIVIAL(debug) << "StorageEngine: Fetching path of " << reference << " for client " << client_id;
  return resolver_.resolve(client_id, reference);
}

std::uintmax_t StorageEngine::read(const std::string& client_id, const std::string& reference,
                                   std::ostream& output) const {
  BOOST_LOG_TRIVIAL(info) << "StorageEngine: Reading " << reference << " for client " << client_id;

  const fs::path file_path = resolver_.resolve(client_id, reference);
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "StorageEngine: Failed to open " << file_path.string();
    throw NotFoundError("File not found: " + reference);
  }

  char buffer[COPY_BUFFER_SIZE];
  std::uintmax_t total_bytes = 0;

  while (file.read(buffer, sizeof(buffer))) {
    output.write(buffer, file.gcount());
    total_bytes += file.gcount();
  }

  // Final partial chunk
  if (file.gcount() > 0) {
    output.write(buffer, file.gcount());
    total_bytes += file.gcount();
  }

  if (file.bad() || !output.good()) {
    BOOST_LOG_TRIVIAL(error) << "StorageEngine: Stream failure while reading " << file_path.string();
    throw FaultError("Failed to read file");
  }

  BOOST_LOG_TRIVIAL(info) << "StorageEngine: Streamed " << total_bytes << " bytes of " << reference;
  return total_bytes;
}

StoredFileRecord StorageEngine::info(const std::string& client_id, const std::string& reference) const {
  BOOST_LOG_TRIVIAL(info) << "StorageEngine: Info for " << reference << " of client " << client_id;

  const fs::path file_path = resolver_.resolve(client_id, reference);
  const std::string relative = resolver_.relative_reference(client_id, file_path);

  // Anything in front of the file name is the owner segment
  const std::size_t slash = relative.find('/');
  const std::string owner = slash == std::string::npos ? std::string() : relative.substr(0, slash);
  return build_record(client_id, owner, file_path);
}

void StorageEngine::remove(const std::string& client_id, const std::string& reference) {
  BOOST_LOG_TRIVIAL(info) << "StorageEngine: Removing " << reference << " for client " << client_id;
  authorize(client_id);

  const fs::path file_path = resolver_.resolve(client_id, reference);

  std::error_code ec;
  if (fs::remove(file_path, ec)) {
    BOOST_LOG_TRIVIAL(info) << "StorageEngine: Removed " << file_path.string();
    return;
  }

  // Nothing removed and no error: someone else unlinked it first
  if (!ec || ec == std::errc::no_such_file_or_directory) {
    BOOST_LOG_TRIVIAL(info) << "StorageEngine: File vanished before removal: " << file_path.string();
    throw NotFoundError("File not found: " + reference);
  }

  BOOST_LOG_TRIVIAL(error) << "StorageEngine: Failed to remove " << file_path.string() << ": " << ec.message();
  throw FaultError("Failed to delete file");
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool StorageEngine::exists(const std::string& client_id, const std::string& reference) const {
  return resolver_.try_resolve(client_id, reference).has_value();
}

FileStatistics StorageEngine::statistics(const std::string& client_id) const {
  BOOST_LOG_TRIVIAL(info) << "StorageEngine: Computing statistics for client " << client_id;

  FileStatistics stats;
  const std::vector<StoredFileRecord> records = list(client_id);
  if (records.empty()) {
    return stats;
  }

  for (const char* bucket : {"0-1MB", "1-10MB", "10-100MB", "100MB+"}) {
    stats.size_breakdown[bucket] = 0;
  }

  for (const auto& record : records) {
    stats.total_files++;
    stats.total_size += record.size;

    CategoryStatistics& category = stats.file_types[record.category];
    category.count++;
    category.total_size += record.size;

    stats.size_breakdown[size_bucket_for(record.size)]++;
  }

  for (auto& [name, category] : stats.file_types) {
    category.percentage = round_percentage(category.count, stats.total_files);
  }

  BOOST_LOG_TRIVIAL(debug) << "StorageEngine: " << stats.total_files << " files, "
                           << stats.total_size << " bytes for client " << client_id;
  return stats;
}


//==============================================
// RECORD SUPPORT
//==============================================

StoredFileRecord StorageEngine::build_record(const std::string& client_id, const std::string& owner,
                                             const fs::path& physical_path) const {
  struct stat file_stat {};
  if (::stat(physical_path.c_str(), &file_stat) != 0) {
    const int err = errno;
    if (err == ENOENT) {
      throw NotFoundError("File not found: " + physical_path.filename().string());
    }
    BOOST_LOG_TRIVIAL(error) << "StorageEngine: stat failed for " << physical_path.string()
                             << ": " << std::strerror(err);
    throw FaultError("Failed to read file metadata");
  }

  StoredFileRecord record;
  record.stored_name = physical_path.filename().string();
  record.original_name = parse_original_name(record.stored_name);
  record.size = static_cast<std::uintmax_t>(file_stat.st_size);
  record.mime_type = mime_type_for(record.original_name);
  record.category = category_for(record.mime_type);
  record.owner = owner;
  record.relative_path = owner.empty() ? record.stored_name : owner + "/" + record.stored_name;
  record.uploaded_at = utils::format_iso8601(utils::from_timespec(file_stat.st_mtim));
  record.download_url = download_url(record.relative_path);
  record.public_url = public_url(client_id, record.relative_path);

  if (!is_generated_name(record.stored_name)) {
    BOOST_LOG_TRIVIAL(debug) << "StorageEngine: Legacy file name " << record.relative_path;
  }
  return record;
}

std::string StorageEngine::public_url(const std::string& client_id, const std::string& relative_path) const {
  std::string url = "/" + config_.public_prefix + "/" + utils::percent_encode(client_id);
  for (const auto& segment : PathResolver::split_reference(relative_path)) {
    url += "/" + utils::percent_encode(segment);
  }
  return url;
}

std::string StorageEngine::download_url(const std::string& relative_path) const {
  std::string url = "/" + config_.download_prefix;
  for (const auto& segment : PathResolver::split_reference(relative_path)) {
    url += "/" + utils::percent_encode(segment);
  }
  return url;
}

void StorageEngine::collect_files(const std::string& client_id, const std::string& owner,
                                  const fs::path& dir, std::vector<StoredFileRecord>& out) const {
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || is_temp_file(it->path())) {
      continue;
    }
    try {
      out.push_back(build_record(client_id, owner, it->path()));
    } catch (const NotFoundError&) {
      BOOST_LOG_TRIVIAL(debug) << "StorageEngine: Skipping file removed during listing: " << it->path().string();
    }
  }

  if (ec && ec != std::errc::no_such_file_or_directory) {
    BOOST_LOG_TRIVIAL(error) << "StorageEngine: Failed to scan " << dir.string() << ": " << ec.message();
    throw FaultError("Failed to list files");
  }
}


//==============================================
// WRITE SUPPORT
//==============================================

void StorageEngine::authorize(const std::string& client_id) const {
  if (gate_ && !gate_->is_authorized(client_id)) {
    BOOST_LOG_TRIVIAL(warning) << "StorageEngine: Key gate rejected client " << client_id;
    throw UnauthorizedError("Invalid or revoked client key");
  }
}

void StorageEngine::ensure_directory(const fs::path& dir) const {
  std::error_code ec;
  fs::create_directories(dir, ec);
  // A concurrent caller may have created it first
  std::error_code check_ec;
  if (ec && !fs::is_directory(dir, check_ec)) {
    BOOST_LOG_TRIVIAL(error) << "StorageEngine: Failed to create directory " << dir.string() << ": " << ec.message();
    throw FaultError("Failed to create storage directory");
  }
}

void StorageEngine::write_atomically(const fs::path& target, std::istream& data) const {
  const fs::path temp_path = target.parent_path() / (TEMP_PREFIX + target.filename().string() + TEMP_SUFFIX);

  std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "StorageEngine: Failed to create file: " << temp_path.string();
    throw FaultError("Failed to create file");
  }

  char buffer[COPY_BUFFER_SIZE];
  std::uintmax_t bytes_written = 0;

  while (data.read(buffer, sizeof(buffer))) {
    file.write(buffer, data.gcount());
    bytes_written += data.gcount();
  }
  if (data.gcount() > 0) {
    file.write(buffer, data.gcount());
    bytes_written += data.gcount();
  }
  file.close();

  std::error_code ec;
  if (data.bad() || !file) {
    BOOST_LOG_TRIVIAL(error) << "StorageEngine: Write failed after " << bytes_written
                             << " bytes: " << temp_path.string();
    fs::remove(temp_path, ec);
    throw FaultError("Failed to write file");
  }

  fs::rename(temp_path, target, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "StorageEngine: Failed to move " << temp_path.string()
                             << " into place: " << ec.message();
    std::error_code cleanup_ec;
    fs::remove(temp_path, cleanup_ec);
    throw FaultError("Failed to write file");
  }

  BOOST_LOG_TRIVIAL(debug) << "StorageEngine: Wrote " << bytes_written << " bytes to " << target.string();
}

} // namespace storage
} // namespace vault
