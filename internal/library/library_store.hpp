#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/media_repository.hpp"
#include "internal/model/media_record.hpp"
#include "internal/util/time.hpp"

namespace zget::library {

/*
  Library Store

  Authoritative catalog of ingested media. Each call is one transaction;
  a write and its full-text index update commit together.

  Errors:
    DuplicateError  uniqueness violation (url, content hash, source id)
    NotFound        unknown id
    StoreError      everything else; never retried here
*/
class LibraryStore {
 public:
  explicit LibraryStore(std::shared_ptr<db::MediaRepository> repository);

  // Returns the assigned id.
  int64_t Insert(model::MediaRecord record);

  bool ExistsByUrl(const std::string& url);
  bool ExistsByHash(const std::string& content_hash);

  model::MediaRecord                Get(int64_t id);
  std::optional<model::MediaRecord> FindByUrl(const std::string& url);
  std::optional<model::MediaRecord> FindByHash(const std::string& content_hash);

  // Prefix phrase match ranked by relevance, then most recent first.
  // A blank query returns nothing.
  std::vector<model::MediaRecord> Search(const std::string& query, uint32_t limit = 50);

  // Persists user-owned fields (tags, rating, notes, collection) and storage paths.
  void Update(const model::MediaRecord& record);

  // Returns whether a record existed.
  bool Delete(int64_t id);

  model::LibraryStats Stats();
  uint64_t            Count();

  std::vector<model::MediaRecord> ListRecent(uint32_t limit = 50);
  std::vector<model::MediaRecord> ListByPlatform(const std::string& platform, uint32_t limit = 50);
  std::vector<model::MediaRecord> ListByCollection(const std::string& collection, uint32_t limit = 50);
  std::vector<model::MediaRecord> ListByUploader(const std::string& uploader, uint32_t limit = 100);

  std::vector<model::UploaderCount> Uploaders();

  // "Today" starts at 00:00 UTC of now's day; the week is the 7 days before now.
  model::DownloadRate DownloadRateStats(util::TimePoint now = util::Now());

  // "it's \"x\"" -> "\"it's \"\"x\"\"\"*"
  static std::string BuildFtsQuery(const std::string& query);

 private:
  [[noreturn]] void ThrowDuplicate(const db::Result& result, const model::MediaRecord& record);

  std::shared_ptr<db::MediaRepository> repository_;
};

} // namespace zget::library
