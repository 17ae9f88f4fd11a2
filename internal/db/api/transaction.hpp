#pragma once

namespace ragctx::db {

/*
  Unit of work against a Repository.

  Reads inside the transaction see its own writes. Nothing is visible to
  other transactions until Commit(). Destroying an unfinished transaction
  rolls it back. Commit() throws util::InvalidState when the backend
  detects a conflicting writer, and util::Unavailable when it fails.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;
};

} // namespace ragctx::db
