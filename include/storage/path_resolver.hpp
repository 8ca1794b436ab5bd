#ifndef VAULT_STORAGE_PATH_RESOLVER_HPP
#define VAULT_STORAGE_PATH_RESOLVER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vault::storage {

// Maps (client, reference) pairs onto physical paths below the storage root.
// A reference is either "file" or "owner/file". Anything that could escape
// the client's namespace is rejected with InvalidArgumentError before the
// filesystem is touched.
class PathResolver {
public:
  // ---- CONSTRUCTOR ----
  explicit PathResolver(const std::filesystem::path& root);


  // ---- NAMESPACE PATHS ----
  // root/<client_id>, client id validated as a single segment
  std::filesystem::path client_root(const std::string& client_id) const;
  // root/<client_id>/<owner>
  std::filesystem::path owner_root(const std::string& client_id, const std::string& owner) const;


  // ---- LOOKUP ----
  // Returns the physical path of an existing regular file.
  // Throws InvalidArgumentError for disallowed references, NotFoundError otherwise.
  std::filesystem::path resolve(const std::string& client_id, const std::string& reference) const;
  // Like resolve but yields nullopt instead of NotFoundError
  std::optional<std::filesystem::path> try_resolve(const std::string& client_id,
                                                   const std::string& reference) const;
  // "file" or "owner/file" for a path inside the client namespace
  std::string relative_reference(const std::string& client_id,
                                 const std::filesystem::path& physical_path) const;


  // ---- VALIDATION ----
  // Throws InvalidArgumentError unless `segment` is a usable single path segment
  static void validate_segment(const std::string& segment, const char* what);
  // Splits and validates a reference into one or two segments
  static std::vector<std::string> split_reference(const std::string& reference);

  const std::filesystem::path& root() const { return root_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path root_;

  // Owner-directory fallback for bare file names. Linear in the number of
  // owners per client.
  std::optional<std::filesystem::path> search_owner_dirs(const std::filesystem::path& client_dir,
                                                         const std::string& filename) const;
  // Guards against anything lexically_normal would lift out of `base`
  static bool is_within(const std::filesystem::path& base, const std::filesystem::path& candidate);
};

} // namespace vault::storage

#endif // VAULT_STORAGE_PATH_RESOLVER_HPP
