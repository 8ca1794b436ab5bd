#include "storage/mime_types.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace vault::storage {

namespace {

const std::unordered_map<std::string, std::string>& extension_table() {
  static const std::unordered_map<std::string, std::string> table = {
    // Images
    {"jpg", "image/jpeg"}, {"jpeg", "image/jpeg"}, {"png", "image/png"},
    {"gif", "image/gif"}, {"bmp", "image/bmp"}, {"webp", "image/webp"},
    {"svg", "image/svg+xml"}, {"ico", "image/x-icon"}, {"tif", "image/tiff"},
    {"tiff", "image/tiff"}, {"heic", "image/heic"},
    // Video
    {"mp4", "video/mp4"}, {"webm", "video/webm"}, {"mov", "video/quicktime"},
    {"avi", "video/x-msvideo"}, {"mkv", "video/x-matroska"}, {"mpeg", "video/mpeg"},
    // Audio
    {"mp3", "audio/mpeg"}, {"wav", "audio/wav"}, {"ogg", "audio/ogg"},
    {"flac", "audio/flac"}, {"aac", "audio/aac"}, {"m4a", "audio/mp4"},
    // Documents
    {"pdf", "application/pdf"},
    {"doc", "application/msword"},
    {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {"odt", "application/vnd.oasis.opendocument.text"},
    {"rtf", "application/rtf"},
    {"xls", "application/vnd.ms-excel"},
    {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {"ods", "application/vnd.oasis.opendocument.spreadsheet"},
    {"ppt", "application/vnd.ms-powerpoint"},
    {"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
    {"odp", "application/vnd.oasis.opendocument.presentation"},
    // Text and code
    {"txt", "text/plain"}, {"log", "text/plain"}, {"md", "text/markdown"},
    {"csv", "text/csv"}, {"html", "text/html"}, {"htm", "text/html"},
    {"css", "text/css"}, {"xml", "application/xml"}, {"json", "application/json"},
    {"js", "text/javascript"}, {"yaml", "application/yaml"}, {"yml", "application/yaml"},
    // Archives
    {"zip", "application/zip"}, {"gz", "application/gzip"}, {"tar", "application/x-tar"},
    {"rar", "application/vnd.rar"}, {"7z", "application/x-7z-compressed"},
    {"bz2", "application/x-bzip2"},
    // Fonts
    {"ttf", "font/ttf"}, {"otf", "font/otf"}, {"woff", "font/woff"}, {"woff2", "font/woff2"},
  };
  return table;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::string mime_type_for(const std::string& filename) {
  std::size_t dot = filename.find_last_of('.');
  if (dot == std::string::npos || dot + 1 == filename.size()) {
    return DEFAULT_MIME_TYPE;
  }

  const auto& table = extension_table();
  auto it = table.find(to_lower(filename.substr(dot + 1)));
  return it != table.end() ? it->second : DEFAULT_MIME_TYPE;
}

std::string category_for(const std::string& mime_type) {
  const std::string mime = to_lower(mime_type);

  if (starts_with(mime, "image/")) return "Images";
  if (starts_with(mime, "video/")) return "Videos";
  if (starts_with(mime, "audio/")) return "Audio";
  if (mime == "application/pdf") return "PDF";
  if (mime == "application/msword" || mime == "application/rtf" ||
      mime.find("wordprocessingml") != std::string::npos ||
      mime.find("opendocument.text") != std::string::npos) {
    return "Documents";
  }
  if (mime == "application/vnd.ms-excel" || mime == "text/csv" ||
      mime.find("spreadsheet") != std::string::npos) {
    return "Spreadsheets";
  }
  if (mime == "application/vnd.ms-powerpoint" ||
      mime.find("presentation") != std::string::npos) {
    return "Presentations";
  }
  if (starts_with(mime, "text/") || mime == "application/json" ||
      mime == "application/xml" || mime == "application/yaml") {
    return "Text";
  }
  if (mime == "application/zip" || mime == "application/gzip" ||
      mime == "application/x-tar" || mime == "application/vnd.rar" ||
      mime == "application/x-7z-compressed" || mime == "application/x-bzip2") {
    return "Archives";
  }
  return "Other";
}

std::string size_bucket_for(std::uintmax_t size_bytes) {
  constexpr std::uintmax_t MB = 1024 * 1024;

  if (size_bytes < MB) return "0-1MB";
  if (size_bytes < 10 * MB) return "1-10MB";
  if (size_bytes < 100 * MB) return "10-100MB";
  return "100MB+";
}

} // namespace vault::storage
