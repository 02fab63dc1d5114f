#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace dispatch::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection serves the whole process; TxMutex() serializes
  transactions on it (SQLite cannot nest BEGIN on one connection).
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

  std::mutex& TxMutex() {
    return tx_mutex_;
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
  std::mutex  tx_mutex_;
};

/*
  Thrown by Exec when SQLite reports BUSY/LOCKED, so callers can map
  it to a retryable conflict.
*/
class SqliteBusy : public std::runtime_error {
 public:
  explicit SqliteBusy(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace dispatch::db::sqlite
