#include "storage/path_resolver.hpp"
#include "storage/storage_error.hpp"
#include <algorithm>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace vault::storage {

namespace fs = std::filesystem;

//==============================================
// CONSTRUCTOR
//==============================================

PathResolver::PathResolver(const fs::path& root)
  : root_(fs::absolute(root).lexically_normal()) {
  BOOST_LOG_TRIVIAL(debug) << "PathResolver: Root set to " << root_.string();
}


//==============================================
// NAMESPACE PATHS
//==============================================

fs::path PathResolver::client_root(const std::string& client_id) const {
  validate_segment(client_id, "client id");
  return root_ / client_id;
}

fs::path PathResolver::owner_root(const std::string& client_id, const std::string& owner) const {
  validate_segment(owner, "owner");
  // Hidden directories are invisible to listings
  if (owner.front() == '.') {
    throw InvalidArgumentError("Owner may not start with '.'");
  }
  return client_root(client_id) / owner;
}


//==============================================
// LOOKUP
//==============================================

fs::path PathResolver::resolve(const std::string& client_id, const std::string& reference) const {
  if (auto found = try_resolve(client_id, reference)) {
    return *found;
  }
  BOOST_LOG_TRIVIAL(info) << "PathResolver: No file " << reference << " for client " << client_id;
  throw NotFoundError("File not found: " + reference);
}

std::optional<fs::path> PathResolver::try_resolve(const std::string& client_id,
                                                  const std::string& reference) const {
  const fs::path client_dir = client_root(client_id);
  const std::vector<std::string> segments = split_reference(reference);

  fs::path candidate = client_dir;
  for (const auto& segment : segments) {
    candidate /= segment;
  }
  candidate = candidate.lexically_normal();

  if (!is_within(client_dir, candidate)) {
    BOOST_LOG_TRIVIAL(warning) << "PathResolver: Reference escapes namespace: " << reference;
    throw InvalidArgumentError("Reference escapes the client namespace");
  }

  // Flat layout, or an explicit owner/file reference
  std::error_code ec;
  if (fs::is_regular_file(candidate, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "PathResolver: Direct match " << candidate.string();
    return candidate;
  }

  if (segments.size() == 1) {
    return search_owner_dirs(client_dir, segments.front());
  }
  return std::nullopt;
}

std::string PathResolver::relative_reference(const std::string& client_id,
                                             const fs::path& physical_path) const {
  const fs::path client_dir = client_root(client_id);
  fs::path relative = physical_path.lexically_normal().lexically_relative(client_dir);
  if (relative.empty() || *relative.begin() == "..") {
    throw InvalidArgumentError("Path is outside the client namespace");
  }
  return relative.generic_string();
}

std::optional<fs::path> PathResolver::search_owner_dirs(const fs::path& client_dir,
                                                        const std::string& filename) const {
  std::error_code ec;
  if (!fs::is_directory(client_dir, ec)) {
    return std::nullopt;
  }

  std::vector<fs::path> owner_dirs;
  for (fs::directory_iterator it(client_dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_directory(type_ec)) {
      owner_dirs.push_back(it->path());
    }
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "PathResolver: Failed to scan " << client_dir.string() << ": " << ec.message();
    throw FaultError("Failed to scan client namespace");
  }

  // Directory iteration order is unspecified; keep the first match stable
  std::sort(owner_dirs.begin(), owner_dirs.end());

  for (const auto& owner_dir : owner_dirs) {
    fs::path candidate = owner_dir / filename;
    std::error_code file_ec;
    if (fs::is_regular_file(candidate, file_ec)) {
      BOOST_LOG_TRIVIAL(debug) << "PathResolver: Owner match " << candidate.string();
      return candidate;
    }
  }
  return std::nullopt;
}


//==============================================
// VALIDATION
//==============================================

void PathResolver::validate_segment(const std::string& segment, const char* what) {
  if (segment.empty()) {
    throw InvalidArgumentError(std::string("Missing ") + what);
  }
  if (segment == "." || segment == "..") {
    throw InvalidArgumentError(std::string("Disallowed ") + what + ": " + segment);
  }
  if (segment.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
    throw InvalidArgumentError(std::string("Disallowed character in ") + what);
  }
}

std::vector<std::string> PathResolver::split_reference(const std::string& reference) {
  if (reference.empty()) {
    throw InvalidArgumentError("Missing file reference");
  }
  if (reference.front() == '/' || reference.front() == '\\') {
    throw InvalidArgumentError("Absolute references are not allowed");
  }

  std::vector<std::string> segments;
  std::size_t start = 0;
  while (true) {
    std::size_t slash = reference.find('/', start);
    segments.push_back(reference.substr(start, slash == std::string::npos ? std::string::npos : slash - start));
    if (slash == std::string::npos) {
      break;
    }
    start = slash + 1;
  }

  if (segments.size() > 2) {
    throw InvalidArgumentError("References are at most owner/file");
  }
  for (const auto& segment : segments) {
    validate_segment(segment, "file reference");
  }
  return segments;
}

bool PathResolver::is_within(const fs::path& base, const fs::path& candidate) {
  auto base_it = base.begin();
  auto cand_it = candidate.begin();
  for (; base_it != base.end(); ++base_it, ++cand_it) {
    if (cand_it == candidate.end() || *base_it != *cand_it) {
      return false;
    }
  }
  return cand_it != candidate.end();
}

} // namespace vault::storage
