#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace ragctx::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    // "tenant_key\npath" -> row; ordered so listings come out by tenant then path
    std::map<std::string, model::DocumentRecord>  documents;
    std::unordered_map<std::string, std::string>  path_key_by_id;
    std::map<std::string, model::SupersessionRecord> supersessions;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace ragctx::db::memory
