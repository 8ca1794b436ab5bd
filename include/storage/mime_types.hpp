#ifndef VAULT_STORAGE_MIME_TYPES_HPP
#define VAULT_STORAGE_MIME_TYPES_HPP

#include <cstdint>
#include <string>

namespace vault::storage {

constexpr const char* DEFAULT_MIME_TYPE = "application/octet-stream";

// Case-insensitive lookup on the file extension
std::string mime_type_for(const std::string& filename);

// Coarse label used by the statistics: Images, Videos, Audio, PDF,
// Documents, Spreadsheets, Presentations, Text, Archives or Other
std::string category_for(const std::string& mime_type);

// Histogram bucket: 0-1MB, 1-10MB, 10-100MB or 100MB+
std::string size_bucket_for(std::uintmax_t size_bytes);

} // namespace vault::storage

#endif // VAULT_STORAGE_MIME_TYPES_HPP
