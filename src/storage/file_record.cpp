#include "storage/file_record.hpp"

namespace vault::storage {

void to_json(nlohmann::json& j, const StoredFileRecord& record) {
  j = nlohmann::json{
    {"storedName", record.stored_name},
    {"originalName", record.original_name},
    {"size", record.size},
    {"mimeType", record.mime_type},
    {"category", record.category},
    {"owner", record.owner.empty() ? nlohmann::json(nullptr) : nlohmann::json(record.owner)},
    {"relativePath", record.relative_path},
    {"uploadedAt", record.uploaded_at},
    {"downloadUrl", record.download_url},
    {"publicUrl", record.public_url}
  };
}

void to_json(nlohmann::json& j, const CategoryStatistics& stats) {
  j = nlohmann::json{
    {"count", stats.count},
    {"totalSize", stats.total_size},
    {"percentage", stats.percentage}
  };
}

void to_json(nlohmann::json& j, const FileStatistics& stats) {
  j = nlohmann::json{
    {"totalFiles", stats.total_files},
    {"totalSize", stats.total_size},
    {"fileTypes", nlohmann::json::object()},
    {"sizeBreakdown", nlohmann::json::object()}
  };
  for (const auto& [category, category_stats] : stats.file_types) {
    j["fileTypes"][category] = category_stats;
  }
  for (const auto& [bucket, count] : stats.size_breakdown) {
    j["sizeBreakdown"][bucket] = count;
  }
}

} // namespace vault::storage
