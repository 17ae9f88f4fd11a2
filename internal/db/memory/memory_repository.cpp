#include "memory_repository.hpp"

#include "internal/model/document.hpp"
#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace ragctx::db::memory {

namespace {

std::string PathKey(const std::string& tenant_key, const std::string& path) {
  return tenant_key + "\n" + path;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Documents
// ------------------------------------------------------------------

Result MemoryRepository::UpsertDocument(Transaction& t, const model::DocumentRecord& r) {
  if (r.id.empty() || r.path.empty()) return Result::Err(ErrorCode::ConstraintViolation, "document id and path are required");

  auto&      s   = TX(t).Mutable();
  const auto key = PathKey(r.tenant_key, r.path);

  // the id must not already belong to another path
  auto owner = s.path_key_by_id.find(r.id);
  if (owner != s.path_key_by_id.end() && owner->second != key) {
    return Result::Err(ErrorCode::ConstraintViolation, "document id already used by another path");
  }

  auto existing = s.documents.find(key);
  if (existing != s.documents.end() && existing->second.id != r.id) {
    s.path_key_by_id.erase(existing->second.id);
  }

  auto row            = r;
  row.promotion_level = ragctx::model::CanonicalPromotionTag(r.promotion_level, r.path);
  if (row.updated_at_ms == 0) row.updated_at_ms = util::NowMs();
  if (row.char_count == 0) row.char_count = row.content.size();

  s.documents[key]       = std::move(row);
  s.path_key_by_id[r.id] = key;
  return Result::Ok();
}

Result MemoryRepository::DeleteDocument(Transaction& t, const std::string& tenant_key, const std::string& path) {
  auto& s  = TX(t).Mutable();
  auto  it = s.documents.find(PathKey(tenant_key, path));
  if (it == s.documents.end()) return Result::Err(ErrorCode::NotFound);
  s.path_key_by_id.erase(it->second.id);
  s.documents.erase(it);
  return Result::Ok();
}

std::optional<model::DocumentRecord> MemoryRepository::GetDocumentById(Transaction& t, const std::string& id) {
  const auto& s   = TX(t).View();
  auto        key = s.path_key_by_id.find(id);
  if (key == s.path_key_by_id.end()) return std::nullopt;
  return s.documents.at(key->second);
}

std::optional<model::DocumentRecord> MemoryRepository::GetDocumentByPath(Transaction& t, const std::string& tenant_key, const std::string& path) {
  const auto& s  = TX(t).View();
  auto        it = s.documents.find(PathKey(tenant_key, path));
  if (it == s.documents.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DocumentRecord> MemoryRepository::GetDocumentsByPaths(Transaction& t, const std::string& tenant_key,
                                                                         const std::vector<std::string>& paths) {
  const auto&                        s = TX(t).View();
  std::vector<model::DocumentRecord> out;
  out.reserve(paths.size());
  for (const auto& path : paths) {
    auto it = s.documents.find(PathKey(tenant_key, path));
    if (it != s.documents.end()) out.push_back(it->second);
  }
  return out;
}

bool MemoryRepository::DocumentExists(Transaction& t, const std::string& tenant_key, const std::string& path) {
  return TX(t).View().documents.contains(PathKey(tenant_key, path));
}

std::vector<model::DocumentRecord> MemoryRepository::ListDocumentsByPromotion(Transaction& t, const std::string& tenant_key,
                                                                              const std::string& promotion_level) {
  std::vector<model::DocumentRecord> out;
  for (const auto& [_, doc] : TX(t).View().documents) {
    if (doc.tenant_key == tenant_key && doc.promotion_level == promotion_level) out.push_back(doc);
  }
  return out;
}

std::vector<model::DocumentRecord> MemoryRepository::ListDocuments(Transaction& t, const std::string& tenant_key) {
  std::vector<model::DocumentRecord> out;
  for (const auto& [_, doc] : TX(t).View().documents) {
    if (doc.tenant_key == tenant_key) out.push_back(doc);
  }
  return out;
}

// ------------------------------------------------------------------
// Supersession
// ------------------------------------------------------------------

Result MemoryRepository::UpsertSupersession(Transaction& t, const model::SupersessionRecord& r) {
  if (r.document_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "document_id is required");

  auto row = r;
  if (row.created_at_ms == 0) row.created_at_ms = util::NowMs();
  TX(t).Mutable().supersessions[r.document_id] = std::move(row);
  return Result::Ok();
}

Result MemoryRepository::DeleteSupersession(Transaction& t, const std::string& document_id) {
  auto& s = TX(t).Mutable();
  if (s.supersessions.erase(document_id) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::optional<model::SupersessionRecord> MemoryRepository::GetSupersession(Transaction& t, const std::string& document_id) {
  const auto& s  = TX(t).View();
  auto        it = s.supersessions.find(document_id);
  if (it == s.supersessions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SupersessionRecord> MemoryRepository::GetSupersededBy(Transaction& t, const std::string& document_id) {
  std::vector<model::SupersessionRecord> out;
  if (document_id.empty()) return out;
  for (const auto& [_, e] : TX(t).View().supersessions)
    if (e.superseded_document_id == document_id) out.push_back(e);
  return out;
}

std::vector<model::SupersessionRecord> MemoryRepository::ListUnresolvedSupersessions(Transaction& t, const std::string& tenant_key,
                                                                                     const std::string& superseded_path) {
  std::vector<model::SupersessionRecord> out;
  for (const auto& [_, e] : TX(t).View().supersessions)
    if (!e.IsResolved() && e.tenant_key == tenant_key && e.superseded_path == superseded_path) out.push_back(e);
  return out;
}

std::vector<model::SupersessionRecord> MemoryRepository::ListSupersessions(Transaction& t) {
  std::vector<model::SupersessionRecord> out;
  for (const auto& [_, e] : TX(t).View().supersessions) out.push_back(e);
  return out;
}

} // namespace ragctx::db::memory
