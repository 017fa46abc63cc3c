#include "sqlite_schema.hpp"

#include <string>

namespace zget::db::sqlite {

void BootstrapSchema(const std::shared_ptr<SqliteDB>& sqlite_db) {
  const char* statements[] = {
      "CREATE TABLE IF NOT EXISTS media ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " source_url TEXT NOT NULL UNIQUE,"
      " platform TEXT NOT NULL,"
      " source_id TEXT NOT NULL,"
      " title TEXT, description TEXT, uploader TEXT, uploader_id TEXT, upload_date TEXT,"
      " duration_seconds INTEGER, view_count INTEGER, like_count INTEGER, comment_count INTEGER,"
      " resolution TEXT, fps REAL, codec TEXT, file_size_bytes INTEGER NOT NULL DEFAULT 0,"
      " content_hash TEXT,"
      " local_path TEXT NOT NULL, thumbnail_path TEXT, ingested_at TEXT NOT NULL,"
      " tags TEXT NOT NULL DEFAULT '[]',"
      " rating INTEGER CHECK (rating IS NULL OR (rating >= 1 AND rating <= 5)),"
      " notes TEXT, collection TEXT, raw_json TEXT,"
      " UNIQUE(platform, source_id));",

      // NULL hashes (never computed) stay out of the uniqueness check
      "CREATE UNIQUE INDEX IF NOT EXISTS idx_media_content_hash ON media(content_hash) WHERE content_hash IS NOT NULL;",
      "CREATE INDEX IF NOT EXISTS idx_media_platform ON media(platform);",
      "CREATE INDEX IF NOT EXISTS idx_media_uploader ON media(uploader);",
      "CREATE INDEX IF NOT EXISTS idx_media_ingested_at ON media(ingested_at);",
      "CREATE INDEX IF NOT EXISTS idx_media_collection ON media(collection);",

      "CREATE VIRTUAL TABLE IF NOT EXISTS media_fts USING fts5("
      " title, description, uploader, tags, notes, content='media', content_rowid='id');",

      "CREATE TRIGGER IF NOT EXISTS media_ai AFTER INSERT ON media BEGIN"
      " INSERT INTO media_fts(rowid, title, description, uploader, tags, notes)"
      " VALUES (new.id, new.title, new.description, new.uploader, new.tags, new.notes);"
      " END;",
      "CREATE TRIGGER IF NOT EXISTS media_ad AFTER DELETE ON media BEGIN"
      " INSERT INTO media_fts(media_fts, rowid, title, description, uploader, tags, notes)"
      " VALUES ('delete', old.id, old.title, old.description, old.uploader, old.tags, old.notes);"
      " END;",
      "CREATE TRIGGER IF NOT EXISTS media_au AFTER UPDATE ON media BEGIN"
      " INSERT INTO media_fts(media_fts, rowid, title, description, uploader, tags, notes)"
      " VALUES ('delete', old.id, old.title, old.description, old.uploader, old.tags, old.notes);"
      " INSERT INTO media_fts(rowid, title, description, uploader, tags, notes)"
      " VALUES (new.id, new.title, new.description, new.uploader, new.tags, new.notes);"
      " END;",

      "CREATE TABLE IF NOT EXISTS schema_version (version INTEGER PRIMARY KEY, applied_at TEXT NOT NULL);"};

  std::lock_guard<std::mutex> lock(sqlite_db->TxMutex());
  sqlite_db->Exec("BEGIN IMMEDIATE;");
  try {
    for (const char* sql : statements) {
      sqlite_db->Exec(sql);
    }
    sqlite_db->Exec("INSERT OR IGNORE INTO schema_version(version, applied_at) VALUES (" + std::to_string(kSchemaVersion) +
                    ", strftime('%Y-%m-%dT%H:%M:%S', 'now'));");
    sqlite_db->Exec("COMMIT;");
  } catch (...) {
    sqlite_db->Exec("ROLLBACK;");
    throw;
  }

  // fail fast if an older file has an incompatible layout
  sqlite_db->Exec("SELECT id,source_url,platform,source_id,content_hash,tags,rating FROM media LIMIT 1;");
  sqlite_db->Exec("SELECT rowid FROM media_fts LIMIT 1;");
}

} // namespace zget::db::sqlite
