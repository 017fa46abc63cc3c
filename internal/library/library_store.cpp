#include "library_store.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace zget::library {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::ConstraintViolation:
      throw util::InvalidArgument(message);
    default:
      throw util::StoreError(message);
  }
}

bool IsBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

LibraryStore::LibraryStore(std::shared_ptr<db::MediaRepository> repository) : repository_(std::move(repository)) {
}

int64_t LibraryStore::Insert(model::MediaRecord record) {
  observability::SpanScope span("library.insert");
  db::Result               result;
  {
    auto tx = repository_->Begin();
    result  = repository_->InsertMedia(*tx, record);
    if (result) {
      tx->Commit();
    }
  }

  if (result.code == db::ErrorCode::AlreadyExists) {
    ThrowDuplicate(result, record);
  }
  ThrowIfDbError(result, "insert media");

  ZGET_LOG_DEBUG("media inserted", {observability::IntField("id", record.id), observability::StringField("url", record.source_url)});
  return record.id;
}

void LibraryStore::ThrowDuplicate(const db::Result& result, const model::MediaRecord& record) {
  // the failed transaction is gone; look up the winner in a fresh one
  if (result.message.find("media.content_hash") != std::string::npos) {
    auto existing = FindByHash(record.content_hash);
    throw util::DuplicateError(util::DuplicateKind::kContentHash, "File content already in library",
                               existing ? std::optional<int64_t>(existing->id) : std::nullopt);
  }
  if (result.message.find("media.source_url") != std::string::npos) {
    auto existing = FindByUrl(record.source_url);
    throw util::DuplicateError(util::DuplicateKind::kUrl, "URL already in library",
                               existing ? std::optional<int64_t>(existing->id) : std::nullopt);
  }

  std::optional<int64_t> existing_id;
  {
    auto tx       = repository_->Begin();
    auto existing = repository_->FindBySourceId(*tx, record.platform, record.source_id);
    if (existing) existing_id = existing->id;
  }
  throw util::DuplicateError(util::DuplicateKind::kSourceId, "Source already in library (" + record.platform + "/" + record.source_id + ")",
                             existing_id);
}

bool LibraryStore::ExistsByUrl(const std::string& url) {
  auto tx = repository_->Begin();
  return repository_->ExistsByUrl(*tx, url);
}

bool LibraryStore::ExistsByHash(const std::string& content_hash) {
  auto tx = repository_->Begin();
  return repository_->ExistsByHash(*tx, content_hash);
}

model::MediaRecord LibraryStore::Get(int64_t id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetMedia(*tx, id);
  if (!record) {
    throw util::NotFound("media " + std::to_string(id) + " not found");
  }
  return *record;
}

std::optional<model::MediaRecord> LibraryStore::FindByUrl(const std::string& url) {
  auto tx = repository_->Begin();
  return repository_->FindByUrl(*tx, url);
}

std::optional<model::MediaRecord> LibraryStore::FindByHash(const std::string& content_hash) {
  auto tx = repository_->Begin();
  return repository_->FindByHash(*tx, content_hash);
}

std::string LibraryStore::BuildFtsQuery(const std::string& query) {
  std::string escaped;
  escaped.reserve(query.size() + 3);
  escaped.push_back('"');
  for (char c : query) {
    if (c == '"') escaped.push_back('"');
    escaped.push_back(c);
  }
  escaped += "\"*";
  return escaped;
}

std::vector<model::MediaRecord> LibraryStore::Search(const std::string& query, uint32_t limit) {
  if (IsBlank(query) || limit == 0) {
    return {};
  }
  observability::SpanScope span("library.search");
  auto                     tx = repository_->Begin();
  return repository_->Search(*tx, BuildFtsQuery(query), limit);
}

void LibraryStore::Update(const model::MediaRecord& record) {
  if (record.rating && (*record.rating < 1 || *record.rating > 5)) {
    throw util::InvalidArgument("rating must be between 1 and 5");
  }
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpdateMedia(*tx, record), "update media");
  tx->Commit();
}

bool LibraryStore::Delete(int64_t id) {
  auto tx     = repository_->Begin();
  auto result = repository_->DeleteMedia(*tx, id);
  if (result.code == db::ErrorCode::NotFound) {
    return false;
  }
  ThrowIfDbError(result, "delete media");
  tx->Commit();
  return true;
}

model::LibraryStats LibraryStore::Stats() {
  auto tx = repository_->Begin();
  return repository_->Stats(*tx);
}

uint64_t LibraryStore::Count() {
  auto tx = repository_->Begin();
  return repository_->Count(*tx);
}

std::vector<model::MediaRecord> LibraryStore::ListRecent(uint32_t limit) {
  auto tx = repository_->Begin();
  return repository_->ListRecent(*tx, limit);
}

std::vector<model::MediaRecord> LibraryStore::ListByPlatform(const std::string& platform, uint32_t limit) {
  auto tx = repository_->Begin();
  return repository_->ListByPlatform(*tx, platform, limit);
}

std::vector<model::MediaRecord> LibraryStore::ListByCollection(const std::string& collection, uint32_t limit) {
  auto tx = repository_->Begin();
  return repository_->ListByCollection(*tx, collection, limit);
}

std::vector<model::MediaRecord> LibraryStore::ListByUploader(const std::string& uploader, uint32_t limit) {
  auto tx = repository_->Begin();
  return repository_->ListByUploader(*tx, uploader, limit);
}

std::vector<model::UploaderCount> LibraryStore::Uploaders() {
  auto tx = repository_->Begin();
  return repository_->Uploaders(*tx);
}

model::DownloadRate LibraryStore::DownloadRateStats(util::TimePoint now) {
  const util::TimePoint day_start  = std::chrono::floor<std::chrono::days>(now);
  const util::TimePoint week_start = now - std::chrono::days(7);

  auto tx = repository_->Begin();
  return repository_->DownloadRateStats(*tx, day_start, week_start);
}

} // namespace zget::library
