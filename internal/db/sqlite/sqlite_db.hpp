#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace calltrace::db::sqlite {

struct SqliteOptions {
  // wait this long for a competing writer (other process) before failing
  int  busy_timeout_ms = 5000;
  bool wal_mode        = true;
  // open an existing file without creating or changing it
  bool read_only = false;
};

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every recording thread. SQLite
  transactions belong to the connection, not the thread, so
  SqliteTransaction holds TxMutex() for its whole lifetime.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  bool ReadOnly() const {
    return options_.read_only;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

 private:
  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

} // namespace calltrace::db::sqlite
