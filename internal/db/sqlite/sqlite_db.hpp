#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace ragctx::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Opened FULLMUTEX so one handle can be shared by every transaction.
  Transactions on the shared handle are serialized through TxMutex().
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

  std::recursive_mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Create tables and indexes if missing. Safe to run on every start.
  void BootstrapSchema();

 private:
  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(bool wal_mode);

  sqlite3*             db_ = nullptr;
  std::string          path_;
  std::recursive_mutex tx_mutex_;
};

} // namespace ragctx::db::sqlite
