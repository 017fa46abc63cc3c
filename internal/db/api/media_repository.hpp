#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/media_record.hpp"
#include "internal/util/time.hpp"

namespace zget::db {

/*
  Repository abstraction for the media library.

  CRITICAL GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - Every write and its full-text index change commit together
  - Uniqueness violations come back as ErrorCode::AlreadyExists with the
    backend message naming the violated column(s)

  Writes return Result; only infrastructure failures (cannot prepare a
  statement, connection lost) throw.
*/

class MediaRepository {
 public:
  virtual ~MediaRepository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Records
  // ---------------------------------------------------------------------

  // On success record.id holds the assigned id.
  virtual Result InsertMedia(Transaction&, model::MediaRecord& record) = 0;

  virtual std::optional<model::MediaRecord> GetMedia(Transaction&, int64_t id) = 0;

  virtual std::optional<model::MediaRecord> FindByUrl(Transaction&, const std::string& url) = 0;

  virtual std::optional<model::MediaRecord> FindByHash(Transaction&, const std::string& content_hash) = 0;

  virtual std::optional<model::MediaRecord> FindBySourceId(Transaction&, const std::string& platform, const std::string& source_id) = 0;

  virtual bool ExistsByUrl(Transaction&, const std::string& url) = 0;

  virtual bool ExistsByHash(Transaction&, const std::string& content_hash) = 0;

  // User-owned fields and storage paths. NotFound when id is unknown.
  virtual Result UpdateMedia(Transaction&, const model::MediaRecord& record) = 0;

  // NotFound when id is unknown.
  virtual Result DeleteMedia(Transaction&, int64_t id) = 0;

  // ---------------------------------------------------------------------
  // Queries
  // ---------------------------------------------------------------------

  // fts_query is passed to the full-text engine verbatim.
  virtual std::vector<model::MediaRecord> Search(Transaction&, const std::string& fts_query, uint32_t limit) = 0;

  virtual std::vector<model::MediaRecord> ListRecent(Transaction&, uint32_t limit) = 0;

  virtual std::vector<model::MediaRecord> ListByPlatform(Transaction&, const std::string& platform, uint32_t limit) = 0;

  virtual std::vector<model::MediaRecord> ListByCollection(Transaction&, const std::string& collection, uint32_t limit) = 0;

  // Matches either the display name or the uploader id.
  virtual std::vector<model::MediaRecord> ListByUploader(Transaction&, const std::string& uploader, uint32_t limit) = 0;

  // (uploader, platform) pairs ordered by record count, descending.
  virtual std::vector<model::UploaderCount> Uploaders(Transaction&) = 0;

  virtual uint64_t Count(Transaction&) = 0;

  virtual model::LibraryStats Stats(Transaction&) = 0;

  // Count and bytes of records ingested at or after day_start, and at or after week_start.
  virtual model::DownloadRate DownloadRateStats(Transaction&, util::TimePoint day_start, util::TimePoint week_start) = 0;
};

} // namespace zget::db
