#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace meshdispatch::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Also owns the process-level writer mutex. SQLite serializes writers
  across processes with BEGIN IMMEDIATE; the mutex does the same for
  threads sharing this connection.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& WriterMutex() {
    return writer_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(bool wal_mode);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  writer_mutex_;
};

// Creates the dispatch tables if missing. Safe to call on every start.
void BootstrapSchema(SqliteDB& db);

} // namespace meshdispatch::db::sqlite
