#pragma once

#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/vector/vector_store.hpp"

namespace ragctx::vector {

/*
  Brute-force cosine search over an in-memory table.
  Keyed by (tenant_key, path); re-upserting a path replaces its vector.
*/
class MemoryVectorStore final : public VectorStore {
 public:
  void   Upsert(const db::model::DocumentRecord& document, std::vector<float> embedding);
  bool   Remove(const std::string& tenant_key, const std::string& path);
  size_t Size() const;

  std::vector<VectorMatch> Search(const std::vector<float>& embedding, std::size_t top_n, const VectorSearchFilter& filter) override;

 private:
  struct Entry {
    db::model::DocumentRecord document;
    std::vector<float>        embedding;
  };

  mutable std::shared_mutex    mutex_;
  std::map<std::string, Entry> entries_;
};

double CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

} // namespace ragctx::vector
