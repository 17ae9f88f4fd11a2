#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace ragctx::db::sqlite {

/*
  Holds the connection's transaction mutex for its whole lifetime and opens
  with BEGIN IMMEDIATE, so the write lock is taken before the first read.
  Only one transaction per connection can be open; a nested Begin() on the
  same thread fails with util::Unavailable.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;

 private:
  std::shared_ptr<SqliteDB>              db_;
  std::unique_lock<std::recursive_mutex> lock_;
  bool                                   finished_ = false;
};

} // namespace ragctx::db::sqlite
