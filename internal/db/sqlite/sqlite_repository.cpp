#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/model/document.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ragctx::db::sqlite {

using ragctx::db::ErrorCode;
using ragctx::db::Result;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

constexpr const char* kDocumentColumns = "id,tenant_key,path,title,summary,content,doc_type,promotion_level,date_ms,char_count,updated_at_ms";
constexpr const char* kSupersessionColumns = "document_id,tenant_key,superseded_path,superseded_document_id,created_at_ms";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

// Reads fail loudly: a backend error must never look like a missing row.
Statement PrepareRead(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw util::Unavailable(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Statement(st, &sqlite3_finalize);
}

bool StepRow(sqlite3* db, sqlite3_stmt* st) {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw util::Unavailable(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

model::DocumentRecord ReadDocument(sqlite3_stmt* st) {
  model::DocumentRecord r;
  r.id         = ColText(st, 0);
  r.tenant_key = ColText(st, 1);
  r.path       = ColText(st, 2);
  r.title      = ColText(st, 3);
  if (sqlite3_column_type(st, 4) != SQLITE_NULL) {
    r.summary = ColText(st, 4);
  }
  r.content         = ColText(st, 5);
  r.doc_type        = ColText(st, 6);
  r.promotion_level = ColText(st, 7);
  r.date_ms         = ColU64(st, 8);
  r.char_count      = ColU64(st, 9);
  r.updated_at_ms   = ColU64(st, 10);
  return r;
}

model::SupersessionRecord ReadSupersession(sqlite3_stmt* st) {
  model::SupersessionRecord r;
  r.document_id            = ColText(st, 0);
  r.tenant_key             = ColText(st, 1);
  r.superseded_path        = ColText(st, 2);
  r.superseded_document_id = ColText(st, 3);
  r.created_at_ms          = ColU64(st, 4);
  return r;
}

std::vector<model::DocumentRecord> CollectDocuments(sqlite3* db, sqlite3_stmt* st) {
  std::vector<model::DocumentRecord> out;
  while (StepRow(db, st)) out.push_back(ReadDocument(st));
  return out;
}

std::vector<model::SupersessionRecord> CollectSupersessions(sqlite3* db, sqlite3_stmt* st) {
  std::vector<model::SupersessionRecord> out;
  while (StepRow(db, st)) out.push_back(ReadSupersession(st));
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Documents
// ------------------------------------------------------------------

Result SqliteRepository::UpsertDocument(Transaction& t, const model::DocumentRecord& r) {
  if (r.id.empty() || r.path.empty()) return Result::Err(ErrorCode::ConstraintViolation, "document id and path are required");

  auto* db = TX(t).Handle();

  // Re-indexing a path under a new id replaces the old row.
  {
    const char*   sql = "DELETE FROM documents WHERE tenant_key=? AND path=? AND id<>?;";
    sqlite3_stmt* st  = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st, 1, r.tenant_key);
    BindText(st, 2, r.path);
    BindText(st, 3, r.id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }

  // ON CONFLICT(id) keeps the id bound to one path; moving it to another path is a constraint violation.
  const char* sql =
      "INSERT INTO documents(id,tenant_key,path,title,summary,content,doc_type,promotion_level,date_ms,char_count,updated_at_ms) "
      "VALUES(?,?,?,?,?,?,?,?,?,?,?) "
      "ON CONFLICT(id) DO UPDATE SET title=excluded.title, summary=excluded.summary, content=excluded.content, "
      "doc_type=excluded.doc_type, promotion_level=excluded.promotion_level, date_ms=excluded.date_ms, "
      "char_count=excluded.char_count, updated_at_ms=excluded.updated_at_ms "
      "WHERE documents.tenant_key=excluded.tenant_key AND documents.path=excluded.path;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.id);
  BindText(st, 2, r.tenant_key);
  BindText(st, 3, r.path);
  BindText(st, 4, r.title);
  if (r.summary) {
    BindText(st, 5, *r.summary);
  } else {
    sqlite3_bind_null(st, 5);
  }
  BindText(st, 6, r.content);
  BindText(st, 7, r.doc_type);
  BindText(st, 8, ragctx::model::CanonicalPromotionTag(r.promotion_level, r.path));
  BindU64(st, 9, r.date_ms);
  BindU64(st, 10, r.char_count != 0 ? r.char_count : r.content.size());
  BindU64(st, 11, r.updated_at_ms != 0 ? r.updated_at_ms : util::NowMs());

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) return Translate(db, rc);

  // the conditional DO UPDATE skipped the row: id belongs to another path
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::ConstraintViolation, "document id already used by another path");
  return Result::Ok();
}

Result SqliteRepository::DeleteDocument(Transaction& t, const std::string& tenant_key, const std::string& path) {
  auto* db = TX(t).Handle();

  const char*   sql = "DELETE FROM documents WHERE tenant_key=? AND path=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, tenant_key);
  BindText(st, 2, path);
  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) return Translate(db, rc);

  return sqlite3_changes(db) == 0 ? Result::Err(ErrorCode::NotFound) : Result::Ok();
}

std::optional<model::DocumentRecord> SqliteRepository::GetDocumentById(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db, std::string("SELECT ") + kDocumentColumns + " FROM documents WHERE id=?;");
  BindText(st.get(), 1, id);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadDocument(st.get());
}

std::optional<model::DocumentRecord> SqliteRepository::GetDocumentByPath(Transaction& t, const std::string& tenant_key, const std::string& path) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db, std::string("SELECT ") + kDocumentColumns + " FROM documents WHERE tenant_key=? AND path=?;");
  BindText(st.get(), 1, tenant_key);
  BindText(st.get(), 2, path);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadDocument(st.get());
}

std::vector<model::DocumentRecord> SqliteRepository::GetDocumentsByPaths(Transaction& t, const std::string& tenant_key,
                                                                         const std::vector<std::string>& paths) {
  std::vector<model::DocumentRecord> out;
  out.reserve(paths.size());

  // one statement, rebound per path, so output keeps the caller's order
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db, std::string("SELECT ") + kDocumentColumns + " FROM documents WHERE tenant_key=? AND path=?;");
  for (const auto& path : paths) {
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());
    BindText(st.get(), 1, tenant_key);
    BindText(st.get(), 2, path);
    if (StepRow(db, st.get())) out.push_back(ReadDocument(st.get()));
  }
  return out;
}

bool SqliteRepository::DocumentExists(Transaction& t, const std::string& tenant_key, const std::string& path) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db, "SELECT 1 FROM documents WHERE tenant_key=? AND path=?;");
  BindText(st.get(), 1, tenant_key);
  BindText(st.get(), 2, path);
  return StepRow(db, st.get());
}

std::vector<model::DocumentRecord> SqliteRepository::ListDocumentsByPromotion(Transaction& t, const std::string& tenant_key,
                                                                              const std::string& promotion_level) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db, std::string("SELECT ") + kDocumentColumns +
                                 " FROM documents WHERE tenant_key=? AND promotion_level=? ORDER BY path;");
  BindText(st.get(), 1, tenant_key);
  BindText(st.get(), 2, promotion_level);
  return CollectDocuments(db, st.get());
}

std::vector<model::DocumentRecord> SqliteRepository::ListDocuments(Transaction& t, const std::string& tenant_key) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db, std::string("SELECT ") + kDocumentColumns + " FROM documents WHERE tenant_key=? ORDER BY path;");
  BindText(st.get(), 1, tenant_key);
  return CollectDocuments(db, st.get());
}

// ------------------------------------------------------------------
// Supersession
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSupersession(Transaction& t, const model::SupersessionRecord& r) {
  if (r.document_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "document_id is required");

  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO supersessions(document_id,tenant_key,superseded_path,superseded_document_id,created_at_ms) VALUES(?,?,?,?,?) "
      "ON CONFLICT(document_id) DO UPDATE SET tenant_key=excluded.tenant_key, superseded_path=excluded.superseded_path, "
      "superseded_document_id=excluded.superseded_document_id, created_at_ms=excluded.created_at_ms;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.document_id);
  BindText(st, 2, r.tenant_key);
  BindText(st, 3, r.superseded_path);
  BindText(st, 4, r.superseded_document_id);
  BindU64(st, 5, r.created_at_ms != 0 ? r.created_at_ms : util::NowMs());

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

Result SqliteRepository::DeleteSupersession(Transaction& t, const std::string& document_id) {
  auto* db = TX(t).Handle();

  const char*   sql = "DELETE FROM supersessions WHERE document_id=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, document_id);
  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) return Translate(db, rc);

  return sqlite3_changes(db) == 0 ? Result::Err(ErrorCode::NotFound) : Result::Ok();
}

std::optional<model::SupersessionRecord> SqliteRepository::GetSupersession(Transaction& t, const std::string& document_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db, std::string("SELECT ") + kSupersessionColumns + " FROM supersessions WHERE document_id=?;");
  BindText(st.get(), 1, document_id);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadSupersession(st.get());
}

std::vector<model::SupersessionRecord> SqliteRepository::GetSupersededBy(Transaction& t, const std::string& document_id) {
  if (document_id.empty()) return {};

  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db, std::string("SELECT ") + kSupersessionColumns +
                                 " FROM supersessions WHERE superseded_document_id=? ORDER BY document_id;");
  BindText(st.get(), 1, document_id);
  return CollectSupersessions(db, st.get());
}

std::vector<model::SupersessionRecord> SqliteRepository::ListUnresolvedSupersessions(Transaction& t, const std::string& tenant_key,
                                                                                     const std::string& superseded_path) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db, std::string("SELECT ") + kSupersessionColumns +
                                 " FROM supersessions WHERE superseded_document_id='' AND tenant_key=? AND superseded_path=? "
                                 "ORDER BY document_id;");
  BindText(st.get(), 1, tenant_key);
  BindText(st.get(), 2, superseded_path);
  return CollectSupersessions(db, st.get());
}

std::vector<model::SupersessionRecord> SqliteRepository::ListSupersessions(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db, std::string("SELECT ") + kSupersessionColumns + " FROM supersessions ORDER BY document_id;");
  return CollectSupersessions(db, st.get());
}

} // namespace ragctx::db::sqlite
