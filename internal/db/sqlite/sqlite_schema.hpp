#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace zget::db::sqlite {

inline constexpr int kSchemaVersion = 1;

/*
  Creates the media table, its full-text index and the triggers that keep
  the index in sync. Idempotent; safe to run on every open.
*/
void BootstrapSchema(const std::shared_ptr<SqliteDB>& sqlite_db);

} // namespace zget::db::sqlite
