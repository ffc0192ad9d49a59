#include "sqlite_db.hpp"

#include <stdexcept>
#include <vector>

namespace meshdispatch::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure(wal_mode);
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure(bool wal_mode) {
  // WAL keeps committed transitions durable across a crash without
  // blocking readers
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  // FULL: a committed PendingAck must survive power loss
  Exec("PRAGMA synchronous=FULL;");

  Exec("PRAGMA foreign_keys=ON;");

  // PRIMARYKEY vs other constraint failures map to different Result codes
  sqlite3_extended_result_codes(db_, 1);

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS deliveries ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " address TEXT NOT NULL,"
      " lat REAL, lon REAL,"
      " status INTEGER NOT NULL,"
      " assigned_unit_id TEXT,"
      " failure_reason TEXT,"
      " created_at_ms INTEGER NOT NULL,"
      " status_changed_at_ms INTEGER NOT NULL,"
      " assigned_at_ms INTEGER NOT NULL DEFAULT 0,"
      " en_route_at_ms INTEGER NOT NULL DEFAULT 0,"
      " arrived_at_ms INTEGER NOT NULL DEFAULT 0,"
      " completed_at_ms INTEGER NOT NULL DEFAULT 0,"
      " version INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS deliveries_unit_idx ON deliveries(assigned_unit_id);",
      "CREATE TABLE IF NOT EXISTS units ("
      " id TEXT PRIMARY KEY,"
      " status INTEGER NOT NULL,"
      " assigned_delivery_id INTEGER REFERENCES deliveries(id),"
      " last_lat REAL, last_lon REAL,"
      " last_contact_ms INTEGER NOT NULL DEFAULT 0,"
      " status_before_offline INTEGER NOT NULL DEFAULT 0,"
      " version INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS pending_acks ("
      " msg_id TEXT PRIMARY KEY,"
      " unit_id TEXT NOT NULL,"
      " delivery_id INTEGER NOT NULL REFERENCES deliveries(id),"
      " kind INTEGER NOT NULL,"
      " payload TEXT NOT NULL,"
      " created_at_ms INTEGER NOT NULL,"
      " attempts INTEGER NOT NULL,"
      " next_retry_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS pending_acks_delivery_idx ON pending_acks(delivery_id);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT id,address,lat,lon,status,assigned_unit_id,failure_reason,version FROM deliveries LIMIT 1;");
  db.Exec("SELECT id,status,assigned_delivery_id,last_contact_ms,status_before_offline,version FROM units LIMIT 1;");
  db.Exec("SELECT msg_id,unit_id,delivery_id,kind,payload,attempts,next_retry_ms FROM pending_acks LIMIT 1;");
}

} // namespace meshdispatch::db::sqlite
