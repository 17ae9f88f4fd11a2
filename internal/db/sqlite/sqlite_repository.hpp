#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace ragctx::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertDocument(Transaction&, const model::DocumentRecord&) override;
  Result DeleteDocument(Transaction&, const std::string& tenant_key, const std::string& path) override;
  std::optional<model::DocumentRecord> GetDocumentById(Transaction&, const std::string& id) override;
  std::optional<model::DocumentRecord> GetDocumentByPath(Transaction&, const std::string& tenant_key, const std::string& path) override;
  std::vector<model::DocumentRecord> GetDocumentsByPaths(Transaction&, const std::string& tenant_key,
                                                         const std::vector<std::string>& paths) override;
  bool DocumentExists(Transaction&, const std::string& tenant_key, const std::string& path) override;
  std::vector<model::DocumentRecord> ListDocumentsByPromotion(Transaction&, const std::string& tenant_key,
                                                              const std::string& promotion_level) override;
  std::vector<model::DocumentRecord> ListDocuments(Transaction&, const std::string& tenant_key) override;

  Result UpsertSupersession(Transaction&, const model::SupersessionRecord&) override;
  Result DeleteSupersession(Transaction&, const std::string& document_id) override;
  std::optional<model::SupersessionRecord> GetSupersession(Transaction&, const std::string& document_id) override;
  std::vector<model::SupersessionRecord> GetSupersededBy(Transaction&, const std::string& document_id) override;
  std::vector<model::SupersessionRecord> ListUnresolvedSupersessions(Transaction&, const std::string& tenant_key,
                                                                     const std::string& superseded_path) override;
  std::vector<model::SupersessionRecord> ListSupersessions(Transaction&) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace ragctx::db::sqlite
