#pragma once

#include <memory>

#include "internal/db/api/media_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace zget::db::sqlite {

class SqliteRepository final : public db::MediaRepository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertMedia(Transaction&, model::MediaRecord&) override;
  std::optional<model::MediaRecord> GetMedia(Transaction&, int64_t) override;
  std::optional<model::MediaRecord> FindByUrl(Transaction&, const std::string&) override;
  std::optional<model::MediaRecord> FindByHash(Transaction&, const std::string&) override;
  std::optional<model::MediaRecord> FindBySourceId(Transaction&, const std::string&, const std::string&) override;
  bool ExistsByUrl(Transaction&, const std::string&) override;
  bool ExistsByHash(Transaction&, const std::string&) override;
  Result UpdateMedia(Transaction&, const model::MediaRecord&) override;
  Result DeleteMedia(Transaction&, int64_t) override;

  std::vector<model::MediaRecord> Search(Transaction&, const std::string&, uint32_t) override;
  std::vector<model::MediaRecord> ListRecent(Transaction&, uint32_t) override;
  std::vector<model::MediaRecord> ListByPlatform(Transaction&, const std::string&, uint32_t) override;
  std::vector<model::MediaRecord> ListByCollection(Transaction&, const std::string&, uint32_t) override;
  std::vector<model::MediaRecord> ListByUploader(Transaction&, const std::string&, uint32_t) override;
  std::vector<model::UploaderCount> Uploaders(Transaction&) override;
  uint64_t Count(Transaction&) override;
  model::LibraryStats Stats(Transaction&) override;
  model::DownloadRate DownloadRateStats(Transaction&, util::TimePoint, util::TimePoint) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
