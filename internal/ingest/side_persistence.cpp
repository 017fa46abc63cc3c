#include "side_persistence.hpp"

#include <google/protobuf/util/json_util.h>

#include <ctime>
#include <system_error>

#include "internal/storage/file_placement.hpp"
#include "internal/storage/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "library/v1/export.pb.h"

namespace zget::ingest {

LocalThumbnailCache::LocalThumbnailCache(std::filesystem::path thumbnails_dir) : thumbnails_dir_(std::move(thumbnails_dir)) {
}

std::optional<std::filesystem::path> LocalThumbnailCache::Cache(const model::MediaRecord& record, const ExtractorResult& result) {
  if (result.thumbnail_file.empty()) {
    return std::nullopt;
  }
  const std::filesystem::path source(result.thumbnail_file);
  std::error_code             ec;
  if (!std::filesystem::is_regular_file(source, ec)) {
    return std::nullopt;
  }

  std::filesystem::create_directories(thumbnails_dir_, ec);
  if (ec) {
    throw util::IOError("create " + thumbnails_dir_.string() + ": " + ec.message());
  }
  const auto base = thumbnails_dir_ / storage::SanitizeFilename(record.platform + "_" + record.source_id + source.extension().string());
  return storage::CopyToNewFile(source, base);
}

JsonExportWriter::JsonExportWriter(std::filesystem::path exports_dir) : exports_dir_(std::move(exports_dir)) {
}

std::string JsonExportWriter::ToJson(const model::MediaRecord& record) {
  zget::library::v1::ExportedMedia out;
  out.set_url(record.source_url);
  out.set_platform(record.platform);
  out.set_source_id(record.source_id);
  out.set_title(record.title);
  out.set_description(record.description);
  out.set_uploader(record.uploader);
  out.set_uploader_id(record.uploader_id);
  if (record.upload_date) {
    *out.mutable_upload_date() = util::ToProto(*record.upload_date);
  }
  if (record.duration_seconds) out.set_duration_seconds(*record.duration_seconds);
  if (record.view_count) out.set_view_count(*record.view_count);
  if (record.like_count) out.set_like_count(*record.like_count);
  out.set_resolution(record.resolution);
  if (record.fps) out.set_fps(*record.fps);
  out.set_codec(record.codec);
  out.set_file_size_bytes(record.file_size_bytes);
  out.set_file_hash_sha256(record.content_hash);
  out.set_local_path(record.local_path);
  *out.mutable_ingested_at() = util::ToProto(record.ingested_at);
  for (const auto& tag : record.tags) {
    out.add_tags(tag);
  }
  if (record.rating) out.set_rating(*record.rating);
  out.set_collection(record.collection);

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(out, &json, options);
  if (!status.ok()) {
    throw util::IOError("export json: " + std::string(status.message()));
  }
  return json;
}

std::filesystem::path JsonExportWriter::Write(const model::MediaRecord& record) {
  std::error_code ec;
  std::filesystem::create_directories(exports_dir_, ec);
  if (ec) {
    throw util::IOError("create " + exports_dir_.string() + ": " + ec.message());
  }

  const std::time_t now = util::Clock::to_time_t(record.ingested_at);
  std::tm           tm{};
  gmtime_r(&now, &tm);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm);

  const auto base = exports_dir_ / storage::SanitizeFilename(record.platform + "_" + record.source_id + "_" + stamp + ".json");
  return storage::WriteNewFile(base, ToJson(record));
}

} // namespace zget::ingest
