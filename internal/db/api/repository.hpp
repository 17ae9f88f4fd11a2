#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/document_record.hpp"
#include "internal/db/model/supersession_record.hpp"

namespace ragctx::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Writes report failures through Result
  - Reads throw util::Unavailable when the backend itself fails;
    a missing row is std::nullopt / an empty vector, never an exception

  The DB is the source of truth for:
    document metadata and content
    supersession relationships
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Documents
  // ---------------------------------------------------------------------

  // Insert or replace the row keyed by (tenant_key, path). The promotion tag is stored canonical.
  virtual Result UpsertDocument(Transaction&, const model::DocumentRecord&) = 0;

  virtual Result DeleteDocument(Transaction&, const std::string& tenant_key, const std::string& path) = 0;

  virtual std::optional<model::DocumentRecord> GetDocumentById(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::DocumentRecord> GetDocumentByPath(Transaction&, const std::string& tenant_key, const std::string& path) = 0;

  // Paths with no row are skipped. Output follows the order of `paths`.
  virtual std::vector<model::DocumentRecord> GetDocumentsByPaths(Transaction&, const std::string& tenant_key,
                                                                 const std::vector<std::string>& paths) = 0;

  virtual bool DocumentExists(Transaction&, const std::string& tenant_key, const std::string& path) = 0;

  // Match on the canonical promotion tag, ordered by path.
  virtual std::vector<model::DocumentRecord> ListDocumentsByPromotion(Transaction&, const std::string& tenant_key,
                                                                      const std::string& promotion_level) = 0;

  // Ordered by path.
  virtual std::vector<model::DocumentRecord> ListDocuments(Transaction&, const std::string& tenant_key) = 0;

  // ---------------------------------------------------------------------
  // Supersession
  // ---------------------------------------------------------------------

  // Insert or replace the outgoing edge of record.document_id.
  virtual Result UpsertSupersession(Transaction&, const model::SupersessionRecord&) = 0;

  virtual Result DeleteSupersession(Transaction&, const std::string& document_id) = 0;

  // Outgoing edge: what `document_id` supersedes.
  virtual std::optional<model::SupersessionRecord> GetSupersession(Transaction&, const std::string& document_id) = 0;

  // Incoming edges: documents that supersede `document_id`. More than one means a branched lineage.
  virtual std::vector<model::SupersessionRecord> GetSupersededBy(Transaction&, const std::string& document_id) = 0;

  virtual std::vector<model::SupersessionRecord> ListUnresolvedSupersessions(Transaction&, const std::string& tenant_key,
                                                                             const std::string& superseded_path) = 0;

  // Every edge, ordered by document_id.
  virtual std::vector<model::SupersessionRecord> ListSupersessions(Transaction&) = 0;
};

} // namespace ragctx::db
