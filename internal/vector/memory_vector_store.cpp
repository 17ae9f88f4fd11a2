#include "internal/vector/memory_vector_store.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ragctx::vector {

namespace {

std::string Key(const std::string& tenant_key, const std::string& path) {
  return tenant_key + "\n" + path;
}

bool PassesFilter(const db::model::DocumentRecord& doc, const VectorSearchFilter& filter) {
  if (doc.tenant_key != filter.tenant_key) return false;

  // unknown tags rank as standard here; the retriever reports them
  const auto level = model::TryParsePromotionLevel(doc.promotion_level).value_or(model::PromotionLevel::kStandard);
  if (level < filter.min_promotion_level) return false;

  if (!filter.doc_types.empty() && std::find(filter.doc_types.begin(), filter.doc_types.end(), doc.doc_type) == filter.doc_types.end()) {
    return false;
  }
  return true;
}

} // namespace

// single pass over both vectors
double CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size() || a.empty()) return 0.0;

  double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }
  const double denom = std::sqrt(norm_a) * std::sqrt(norm_b);
  return denom > 0.0 ? dot / denom : 0.0;
}

void MemoryVectorStore::Upsert(const db::model::DocumentRecord& document, std::vector<float> embedding) {
  std::unique_lock lock(mutex_);
  entries_[Key(document.tenant_key, document.path)] = Entry{document, std::move(embedding)};
}

bool MemoryVectorStore::Remove(const std::string& tenant_key, const std::string& path) {
  std::unique_lock lock(mutex_);
  return entries_.erase(Key(tenant_key, path)) > 0;
}

size_t MemoryVectorStore::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

std::vector<VectorMatch> MemoryVectorStore::Search(const std::vector<float>& embedding, std::size_t top_n, const VectorSearchFilter& filter) {
  if (embedding.empty()) {
    throw util::InvalidArgument("query embedding is empty");
  }

  std::vector<VectorMatch> matches;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [_, entry] : entries_) {
      if (!PassesFilter(entry.document, filter)) continue;
      if (entry.embedding.size() != embedding.size()) {
        RAGCTX_LOG_WARN("embedding dimension mismatch, skipping document",
                        {observability::StringField("path", entry.document.path),
                         observability::IntField("stored_dim", static_cast<std::int64_t>(entry.embedding.size())),
                         observability::IntField("query_dim", static_cast<std::int64_t>(embedding.size()))});
        continue;
      }
      matches.push_back(VectorMatch{entry.document, CosineSimilarity(embedding, entry.embedding)});
    }
  }

  std::stable_sort(matches.begin(), matches.end(), [](const VectorMatch& a, const VectorMatch& b) {
    if (a.raw_score != b.raw_score) return a.raw_score > b.raw_score;
    return a.document.path < b.document.path;
  });
  if (matches.size() > top_n) matches.resize(top_n);
  return matches;
}

} // namespace ragctx::vector
