#include "EventDB.hpp"
#include "supervisor/Logger.hpp"
#include <sqlite3.h>

EventDB::~EventDB() {
    if (db) sqlite3_close(db);
}

bool EventDB::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(mtx);
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        logError("EventDB", std::string("can't open database: ") + sqlite3_errmsg(db));
        sqlite3_close(db);
        db = nullptr;
        return false;
    }
    const char* sql =
        "PRAGMA journal_mode=WAL;"
        "CREATE TABLE IF NOT EXISTS events("
        " id TEXT PRIMARY KEY, camera_id TEXT NOT NULL, zone_id TEXT,"
        " start_ts INTEGER, end_ts INTEGER, created_ts INTEGER, confidence REAL,"
        " person_count INTEGER, media_state TEXT, approval TEXT,"
        " collage TEXT, clip TEXT, preview TEXT, clip_source TEXT, reason TEXT,"
        " updated_ts INTEGER DEFAULT (strftime('%s','now')));"
        "CREATE INDEX IF NOT EXISTS idx_events_camera ON events(camera_id, start_ts);";
    char* errMsg = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &errMsg) != SQLITE_OK) {
        logError("EventDB", std::string("SQL error: ") + (errMsg ? errMsg : "?"));
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

void EventDB::publish(const Event& ev) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!db) return;
    const char* sql =
        "INSERT OR REPLACE INTO events (id, camera_id, zone_id, start_ts, end_ts, created_ts, confidence,"
        " person_count, media_state, approval, collage, clip, preview, clip_source, reason)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        logError("EventDB", std::string("prepare: ") + sqlite3_errmsg(db));
        return;
    }
    sqlite3_bind_text(stmt, 1, ev.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, ev.cameraId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, ev.zoneId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, ev.startMs);
    sqlite3_bind_int64(stmt, 5, ev.endMs);
    sqlite3_bind_int64(stmt, 6, ev.createdMs);
    sqlite3_bind_double(stmt, 7, ev.confidence);
    sqlite3_bind_int(stmt, 8, ev.personCount);
    sqlite3_bind_text(stmt, 9, toString(ev.media), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 10, toString(ev.approval), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 11, ev.collagePath.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 12, ev.clipPath.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 13, ev.previewPath.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 14, ev.clipSource.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 15, ev.failureReason.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        logError("EventDB", std::string("insert ") + ev.id + ": " + sqlite3_errmsg(db));
    }
    sqlite3_finalize(stmt);
}

static std::string columnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* t = sqlite3_column_text(stmt, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static StoredEvent readRow(sqlite3_stmt* stmt) {
    StoredEvent e;
    e.id = columnText(stmt, 0);
    e.cameraId = columnText(stmt, 1);
    e.zoneId = columnText(stmt, 2);
    e.startMs = sqlite3_column_int64(stmt, 3);
    e.endMs = sqlite3_column_int64(stmt, 4);
    e.confidence = sqlite3_column_double(stmt, 5);
    e.mediaState = columnText(stmt, 6);
    e.approval = columnText(stmt, 7);
    e.collagePath = columnText(stmt, 8);
    e.clipPath = columnText(stmt, 9);
    e.previewPath = columnText(stmt, 10);
    e.reason = columnText(stmt, 11);
    e.createdMs = sqlite3_column_int64(stmt, 12);
    return e;
}

static const char* SELECT_COLUMNS =
    "SELECT id, camera_id, zone_id, start_ts, end_ts, confidence, media_state, approval,"
    " collage, clip, preview, reason, created_ts FROM events ";

std::optional<StoredEvent> EventDB::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!db) return std::nullopt;
    std::string sql = std::string(SELECT_COLUMNS) + "WHERE id = ?;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return std::nullopt;
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    std::optional<StoredEvent> out;
    if (sqlite3_step(stmt) == SQLITE_ROW) out = readRow(stmt);
    sqlite3_finalize(stmt);
    return out;
}

std::vector<StoredEvent> EventDB::byCamera(const std::string& cameraId, int64_t fromMs, int64_t toMs) {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<StoredEvent> out;
    if (!db) return out;
    std::string sql = std::string(SELECT_COLUMNS) +
                      "WHERE camera_id = ? AND end_ts >= ? AND start_ts <= ? ORDER BY start_ts;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        logError("EventDB", std::string("prepare: ") + sqlite3_errmsg(db));
        return out;
    }
    sqlite3_bind_text(stmt, 1, cameraId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, fromMs);
    sqlite3_bind_int64(stmt, 3, toMs);
    while (sqlite3_step(stmt) == SQLITE_ROW) out.push_back(readRow(stmt));
    sqlite3_finalize(stmt);
    return out;
}

std::map<std::string, int64_t> EventDB::lastEventTimes(const std::string& cameraId) {
    std::lock_guard<std::mutex> lock(mtx);
    std::map<std::string, int64_t> out;
    if (!db) return out;
    const char* sql = "SELECT zone_id, MAX(created_ts) FROM events WHERE camera_id = ? GROUP BY zone_id;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        logError("EventDB", std::string("prepare: ") + sqlite3_errmsg(db));
        return out;
    }
    sqlite3_bind_text(stmt, 1, cameraId.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        out[columnText(stmt, 0)] = sqlite3_column_int64(stmt, 1);
    }
    sqlite3_finalize(stmt);
    return out;
}
