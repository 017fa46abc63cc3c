#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace zget::db::sqlite {

/*
  Thin RAII wrapper around a shared sqlite3* connection.

  The connection is opened FULLMUTEX and shared by every thread; TxMutex()
  serializes transactions on it so one thread's BEGIN never nests inside
  another's.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, uint32_t busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(uint32_t busy_timeout_ms);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace zget::db::sqlite
