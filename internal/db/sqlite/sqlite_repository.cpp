#include "sqlite_repository.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <sqlite3.h>

#include "internal/util/errors.hpp"

namespace zget::db::sqlite {

using zget::db::ErrorCode;
using zget::db::Result;

namespace {

struct StatementRelease {
    void operator()(sqlite3_stmt* st) const {
        sqlite3_finalize(st);
    }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementRelease>;

// Every SELECT of a full row uses this column order; see ReadMedia.
constexpr const char* kMediaColumns =
    "m.id,m.source_url,m.platform,m.source_id,m.title,m.description,m.uploader,m.uploader_id,m.upload_date,"
    "m.duration_seconds,m.view_count,m.like_count,m.comment_count,m.resolution,m.fps,m.codec,m.file_size_bytes,"
    "m.content_hash,m.local_path,m.thumbnail_path,m.ingested_at,m.tags,m.rating,m.notes,m.collection,m.raw_json";

Statement PrepareOrThrow(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        throw util::StoreError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return Statement(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// Empty strings are stored as NULL.
void BindTextOrNull(sqlite3_stmt* st, int idx, const std::string& s) {
    if (s.empty()) {
        sqlite3_bind_null(st, idx);
    } else {
        BindText(st, idx, s);
    }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

template <typename T>
void BindOptionalI64(sqlite3_stmt* st, int idx, const std::optional<T>& v) {
    if (v.has_value()) {
        sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(*v));
    } else {
        sqlite3_bind_null(st, idx);
    }
}

void BindOptionalDouble(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
    if (v.has_value()) {
        sqlite3_bind_double(st, idx, *v);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

void BindOptionalTime(sqlite3_stmt* st, int idx, const std::optional<util::TimePoint>& v) {
    if (v.has_value()) {
        BindText(st, idx, util::FormatIso8601(*v));
    } else {
        sqlite3_bind_null(st, idx);
    }
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

bool ColIsNull(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::optional<int64_t> ColOptionalI64(sqlite3_stmt* st, int col) {
    if (ColIsNull(st, col)) return std::nullopt;
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

std::optional<double> ColOptionalDouble(sqlite3_stmt* st, int col) {
    if (ColIsNull(st, col)) return std::nullopt;
    return sqlite3_column_double(st, col);
}

// Tags are stored as a JSON array so the full-text index sees every tag.
std::string EncodeTags(const std::vector<std::string>& tags) {
    google::protobuf::ListValue list;
    for (const auto& tag : tags) {
        list.add_values()->set_string_value(tag);
    }
    std::string json;
    auto        status = google::protobuf::util::MessageToJsonString(list, &json);
    if (!status.ok()) {
        throw util::StoreError("encode tags: " + std::string(status.message()));
    }
    return json;
}

std::vector<std::string> DecodeTags(const std::string& json) {
    std::vector<std::string> tags;
    if (json.empty()) {
        return tags;
    }
    google::protobuf::ListValue list;
    if (!google::protobuf::util::JsonStringToMessage(json, &list).ok()) {
        return tags;
    }
    for (const auto& value : list.values()) {
        if (value.has_string_value()) {
            tags.push_back(value.string_value());
        }
    }
    return tags;
}

model::MediaRecord ReadMedia(sqlite3_stmt* st) {
    model::MediaRecord r;
    r.id               = sqlite3_column_int64(st, 0);
    r.source_url       = ColText(st, 1);
    r.platform         = ColText(st, 2);
    r.source_id        = ColText(st, 3);
    r.title            = ColText(st, 4);
    r.description      = ColText(st, 5);
    r.uploader         = ColText(st, 6);
    r.uploader_id      = ColText(st, 7);
    r.upload_date      = ColIsNull(st, 8) ? std::nullopt : util::ParseIso8601(ColText(st, 8));
    r.duration_seconds = ColOptionalI64(st, 9);
    r.view_count       = ColOptionalI64(st, 10);
    r.like_count       = ColOptionalI64(st, 11);
    r.comment_count    = ColOptionalI64(st, 12);
    r.resolution       = ColText(st, 13);
    r.fps              = ColOptionalDouble(st, 14);
    r.codec            = ColText(st, 15);
    r.file_size_bytes  = static_cast<uint64_t>(sqlite3_column_int64(st, 16));
    r.content_hash     = ColText(st, 17);
    r.local_path       = ColText(st, 18);
    r.thumbnail_path   = ColText(st, 19);
    r.ingested_at      = util::ParseIso8601(ColText(st, 20)).value_or(util::TimePoint{});
    r.tags             = DecodeTags(ColText(st, 21));
    if (auto rating = ColOptionalI64(st, 22)) r.rating = static_cast<int>(*rating);
    r.notes      = ColText(st, 23);
    r.collection = ColText(st, 24);
    r.raw_json   = ColText(st, 25);
    return r;
}

std::vector<model::MediaRecord> ReadAll(sqlite3* db, sqlite3_stmt* st) {
    std::vector<model::MediaRecord> out;
    int                             rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadMedia(st));
    }
    if (rc != SQLITE_DONE) {
        throw util::StoreError(std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
    return out;
}

std::optional<model::MediaRecord> ReadOne(sqlite3* db, sqlite3_stmt* st) {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) {
        return ReadMedia(st);
    }
    if (rc != SQLITE_DONE) {
        throw util::StoreError(std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
    return std::nullopt;
}

bool StepExists(sqlite3* db, sqlite3_stmt* st) {
    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        throw util::StoreError(std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
    return rc == SQLITE_ROW;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            // message names the columns, e.g. "UNIQUE constraint failed: media.source_url"
            if (rc == SQLITE_CONSTRAINT_UNIQUE || rc == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Records
// ------------------------------------------------------------------

Result SqliteRepository::InsertMedia(Transaction& t, model::MediaRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO media(source_url,platform,source_id,title,description,uploader,uploader_id,upload_date,"
        "duration_seconds,view_count,like_count,comment_count,resolution,fps,codec,file_size_bytes,content_hash,"
        "local_path,thumbnail_path,ingested_at,tags,rating,notes,collection,raw_json) "
        "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindText(raw, 1, r.source_url);
    BindText(raw, 2, r.platform);
    BindText(raw, 3, r.source_id);
    BindTextOrNull(raw, 4, r.title);
    BindTextOrNull(raw, 5, r.description);
    BindTextOrNull(raw, 6, r.uploader);
    BindTextOrNull(raw, 7, r.uploader_id);
    BindOptionalTime(raw, 8, r.upload_date);
    BindOptionalI64(raw, 9, r.duration_seconds);
    BindOptionalI64(raw, 10, r.view_count);
    BindOptionalI64(raw, 11, r.like_count);
    BindOptionalI64(raw, 12, r.comment_count);
    BindTextOrNull(raw, 13, r.resolution);
    BindOptionalDouble(raw, 14, r.fps);
    BindTextOrNull(raw, 15, r.codec);
    BindI64(raw, 16, static_cast<int64_t>(r.file_size_bytes));
    BindTextOrNull(raw, 17, r.content_hash);
    BindText(raw, 18, r.local_path);
    BindTextOrNull(raw, 19, r.thumbnail_path);
    BindText(raw, 20, util::FormatIso8601(r.ingested_at));
    BindText(raw, 21, EncodeTags(r.tags));
    BindOptionalI64(raw, 22, r.rating);
    BindTextOrNull(raw, 23, r.notes);
    BindTextOrNull(raw, 24, r.collection);
    BindTextOrNull(raw, 25, r.raw_json);

    int rc = sqlite3_step(raw);
    auto result = Translate(db, rc);
    if (result) {
        r.id = sqlite3_last_insert_rowid(db);
    }
    return result;
}

std::optional<model::MediaRecord> SqliteRepository::GetMedia(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();
    auto st = PrepareOrThrow(db, std::string("SELECT ") + kMediaColumns + " FROM media m WHERE m.id=?;");
    BindI64(st.get(), 1, id);
    return ReadOne(db, st.get());
}

std::optional<model::MediaRecord> SqliteRepository::FindByUrl(Transaction& t, const std::string& url) {
    auto* db = TX(t).Handle();
    auto st = PrepareOrThrow(db, std::string("SELECT ") + kMediaColumns + " FROM media m WHERE m.source_url=?;");
    BindText(st.get(), 1, url);
    return ReadOne(db, st.get());
}

std::optional<model::MediaRecord> SqliteRepository::FindByHash(Transaction& t, const std::string& content_hash) {
    auto* db = TX(t).Handle();
    auto st = PrepareOrThrow(db, std::string("SELECT ") + kMediaColumns + " FROM media m WHERE m.content_hash=?;");
    BindText(st.get(), 1, content_hash);
    return ReadOne(db, st.get());
}

std::optional<model::MediaRecord> SqliteRepository::FindBySourceId(Transaction& t, const std::string& platform,
                                                                    const std::string& source_id) {
    auto* db = TX(t).Handle();
    auto st = PrepareOrThrow(db, std::string("SELECT ") + kMediaColumns + " FROM media m WHERE m.platform=? AND m.source_id=?;");
    BindText(st.get(), 1, platform);
    BindText(st.get(), 2, source_id);
    return ReadOne(db, st.get());
}

bool SqliteRepository::ExistsByUrl(Transaction& t, const std::string& url) {
    auto* db = TX(t).Handle();
    auto st = PrepareOrThrow(db, "SELECT 1 FROM media WHERE source_url=? LIMIT 1;");
    BindText(st.get(), 1, url);
    return StepExists(db, st.get());
}

bool SqliteRepository::ExistsByHash(Transaction& t, const std::string& content_hash) {
    auto* db = TX(t).Handle();
    auto st = PrepareOrThrow(db, "SELECT 1 FROM media WHERE content_hash=? LIMIT 1;");
    BindText(st.get(), 1, content_hash);
    return StepExists(db, st.get());
}

Result SqliteRepository::UpdateMedia(Transaction& t, const model::MediaRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE media SET tags=?,rating=?,notes=?,collection=?,local_path=?,thumbnail_path=? WHERE id=?;";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindText(raw, 1, EncodeTags(r.tags));
    BindOptionalI64(raw, 2, r.rating);
    BindTextOrNull(raw, 3, r.notes);
    BindTextOrNull(raw, 4, r.collection);
    BindText(raw, 5, r.local_path);
    BindTextOrNull(raw, 6, r.thumbnail_path);
    BindI64(raw, 7, r.id);

    int rc = sqlite3_step(raw);
    auto result = Translate(db, rc);
    if (result && sqlite3_changes(db) == 0) {
        return Result::Err(ErrorCode::NotFound, "media " + std::to_string(r.id) + " not found");
    }
    return result;
}

Result SqliteRepository::DeleteMedia(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM media WHERE id=?;", -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindI64(raw, 1, id);
    int rc = sqlite3_step(raw);
    auto result = Translate(db, rc);
    if (result && sqlite3_changes(db) == 0) {
        return Result::Err(ErrorCode::NotFound, "media " + std::to_string(id) + " not found");
    }
    return result;
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

std::vector<model::MediaRecord> SqliteRepository::Search(Transaction& t, const std::string& fts_query, uint32_t limit) {
    auto* db = TX(t).Handle();
    auto st = PrepareOrThrow(db, std::string("SELECT ") + kMediaColumns +
                                     " FROM media_fts JOIN media m ON m.id = media_fts.rowid"
                                     " WHERE media_fts MATCH ?"
                                     " ORDER BY media_fts.rank, m.ingested_at DESC, m.id DESC LIMIT ?;");
    BindText(st.get(), 1, fts_query);
    BindI64(st.get(), 2, limit);
    return ReadAll(db, st.get());
}

std::vector<model::MediaRecord> SqliteRepository::ListRecent(Transaction& t, uint32_t limit) {
    auto* db = TX(t).Handle();
    auto st = PrepareOrThrow(db, std::string("SELECT ") + kMediaColumns + " FROM media m ORDER BY m.ingested_at DESC, m.id DESC LIMIT ?;");
    BindI64(st.get(), 1, limit);
    return ReadAll(db, st.get());
}

std::vector<model::MediaRecord> SqliteRepository::ListByPlatform(Transaction& t, const std::string& platform, uint32_t limit) {
    auto* db = TX(t).Handle();
    auto st = PrepareOrThrow(db, std::string("SELECT ") + kMediaColumns +
                                     " FROM media m WHERE m.platform=? ORDER BY m.ingested_at DESC, m.id DESC LIMIT ?;");
    BindText(st.get(), 1, platform);
    BindI64(st.get(), 2, limit);
    return ReadAll(db, st.get());
}

std::vector<model::MediaRecord> SqliteRepository::ListByCollection(Transaction& t, const std::string& collection, uint32_t limit) {
    auto* db = TX(t).Handle();
    auto st = PrepareOrThrow(db, std::string("SELECT ") + kMediaColumns +
                                     " FROM media m WHERE m.collection=? ORDER BY m.ingested_at DESC, m.id DESC LIMIT ?;");
    BindText(st.get(), 1, collection);
    BindI64(st.get(), 2, limit);
    return ReadAll(db, st.get());
}

std::vector<model::MediaRecord> SqliteRepository::ListByUploader(Transaction& t, const std::string& uploader, uint32_t limit) {
    auto* db = TX(t).Handle();
    auto st = PrepareOrThrow(db, std::string("SELECT ") + kMediaColumns +
                                     " FROM media m WHERE m.uploader=? OR m.uploader_id=? ORDER BY m.ingested_at DESC, m.id DESC LIMIT ?;");
    BindText(st.get(), 1, uploader);
    BindText(st.get(), 2, uploader);
    BindI64(st.get(), 3, limit);
    return ReadAll(db, st.get());
}

std::vector<model::UploaderCount> SqliteRepository::Uploaders(Transaction& t) {
    auto* db = TX(t).Handle();
    auto st = PrepareOrThrow(db, "SELECT COALESCE(uploader,''), platform, COUNT(*) AS n FROM media"
                                 " GROUP BY uploader, platform ORDER BY n DESC, uploader, platform;");

    std::vector<model::UploaderCount> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back({ColText(st.get(), 0), ColText(st.get(), 1), static_cast<uint64_t>(sqlite3_column_int64(st.get(), 2))});
    }
    if (rc != SQLITE_DONE) {
        throw util::StoreError(std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
    return out;
}

uint64_t SqliteRepository::Count(Transaction& t) {
    auto* db = TX(t).Handle();
    auto st = PrepareOrThrow(db, "SELECT COUNT(*) FROM media;");
    if (sqlite3_step(st.get()) != SQLITE_ROW) {
        throw util::StoreError(std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
    return static_cast<uint64_t>(sqlite3_column_int64(st.get(), 0));
}

model::LibraryStats SqliteRepository::Stats(Transaction& t) {
    auto* db = TX(t).Handle();
    model::LibraryStats stats;

    auto totals = PrepareOrThrow(db, "SELECT COUNT(*), COALESCE(SUM(file_size_bytes),0) FROM media;");
    if (sqlite3_step(totals.get()) != SQLITE_ROW) {
        throw util::StoreError(std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
    stats.count       = static_cast<uint64_t>(sqlite3_column_int64(totals.get(), 0));
    stats.total_bytes = static_cast<uint64_t>(sqlite3_column_int64(totals.get(), 1));

    auto per_platform = PrepareOrThrow(db, "SELECT platform, COUNT(*) AS n FROM media GROUP BY platform ORDER BY n DESC, platform;");
    int  rc;
    while ((rc = sqlite3_step(per_platform.get())) == SQLITE_ROW) {
        stats.platforms.push_back({ColText(per_platform.get(), 0), static_cast<uint64_t>(sqlite3_column_int64(per_platform.get(), 1))});
    }
    if (rc != SQLITE_DONE) {
        throw util::StoreError(std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
    return stats;
}

model::DownloadRate SqliteRepository::DownloadRateStats(Transaction& t, util::TimePoint day_start, util::TimePoint week_start) {
    auto* db = TX(t).Handle();
    // ingested_at is fixed-width ISO-8601 text, so text order is time order
    auto st = PrepareOrThrow(db,
                             "SELECT"
                             " COALESCE(SUM(ingested_at >= ?1),0),"
                             " COALESCE(SUM(CASE WHEN ingested_at >= ?1 THEN file_size_bytes ELSE 0 END),0),"
                             " COALESCE(SUM(ingested_at >= ?2),0),"
                             " COALESCE(SUM(CASE WHEN ingested_at >= ?2 THEN file_size_bytes ELSE 0 END),0)"
                             " FROM media;");
    BindText(st.get(), 1, util::FormatIso8601(day_start));
    BindText(st.get(), 2, util::FormatIso8601(week_start));
    if (sqlite3_step(st.get()) != SQLITE_ROW) {
        throw util::StoreError(std::string("sqlite step: ") + sqlite3_errmsg(db));
    }

    model::DownloadRate rate;
    rate.today_count = static_cast<uint64_t>(sqlite3_column_int64(st.get(), 0));
    rate.today_bytes = static_cast<uint64_t>(sqlite3_column_int64(st.get(), 1));
    rate.week_count  = static_cast<uint64_t>(sqlite3_column_int64(st.get(), 2));
    rate.week_bytes  = static_cast<uint64_t>(sqlite3_column_int64(st.get(), 3));
    return rate;
}

} // namespace zget::db::sqlite
