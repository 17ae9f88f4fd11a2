#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ragctx::db::sqlite {

namespace {

void ExecOrUnavailable(SqliteDB& db, const char* sql) {
  try {
    db.Exec(sql);
  } catch (const std::runtime_error& e) {
    throw util::Unavailable(std::string("sqlite ") + sql + " " + e.what());
  }
}

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  ExecOrUnavailable(*db_, "BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      RAGCTX_LOG_ERROR("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw util::InvalidState("transaction already finished");
  }
  ExecOrUnavailable(*db_, "COMMIT;");
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  ExecOrUnavailable(*db_, "ROLLBACK;");
}

} // namespace ragctx::db::sqlite
