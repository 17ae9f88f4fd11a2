#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/db/model/document_record.hpp"
#include "internal/model/document.hpp"

namespace ragctx::vector {

struct VectorSearchFilter {
  std::string           tenant_key;
  model::PromotionLevel min_promotion_level = model::PromotionLevel::kStandard;
  // empty = every doc type
  std::vector<std::string> doc_types;
};

struct VectorMatch {
  db::model::DocumentRecord document;
  double                    raw_score = 0.0;
};

/*
  Similarity search backend.

  Implementations return at most top_n matches, best first, and throw
  util::Unavailable when the backend cannot be reached. An empty vector
  always means "nothing matched".
*/
class VectorStore {
 public:
  virtual ~VectorStore() = default;

  virtual std::vector<VectorMatch> Search(const std::vector<float>& embedding, std::size_t top_n, const VectorSearchFilter& filter) = 0;
};

} // namespace ragctx::vector
