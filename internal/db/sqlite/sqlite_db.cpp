#include "sqlite_db.hpp"

#include <stdexcept>
#include <vector>

namespace ragctx::db::sqlite {

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

void SqliteDB::Configure(bool wal_mode) {
  // WAL lets readers proceed while the indexer holds the write lock
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void SqliteDB::BootstrapSchema() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS documents (id TEXT PRIMARY KEY, tenant_key TEXT NOT NULL, path TEXT NOT NULL, title TEXT NOT NULL, "
      "summary TEXT, content TEXT NOT NULL, doc_type TEXT NOT NULL, promotion_level TEXT NOT NULL, date_ms INTEGER NOT NULL DEFAULT 0, "
      "char_count INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, UNIQUE(tenant_key, path));",
      "CREATE INDEX IF NOT EXISTS documents_promotion ON documents(tenant_key, promotion_level);",
      "CREATE TABLE IF NOT EXISTS supersessions (document_id TEXT PRIMARY KEY, tenant_key TEXT NOT NULL, superseded_path TEXT NOT NULL, "
      "superseded_document_id TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS supersessions_target ON supersessions(superseded_document_id);",
      "CREATE INDEX IF NOT EXISTS supersessions_path ON supersessions(tenant_key, superseded_path);",
      "CREATE TABLE IF NOT EXISTS ragctx_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO ragctx_schema_migrations(version, applied_at_ms) VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};

  for (const auto& sql : kBootstrapSql) {
    Exec(sql);
  }

  // fail fast on a file created by an incompatible build
  Exec("SELECT id,tenant_key,path,title,summary,content,doc_type,promotion_level,date_ms,char_count,updated_at_ms FROM documents LIMIT 1;");
  Exec("SELECT document_id,tenant_key,superseded_path,superseded_document_id,created_at_ms FROM supersessions LIMIT 1;");
}

} // namespace ragctx::db::sqlite
