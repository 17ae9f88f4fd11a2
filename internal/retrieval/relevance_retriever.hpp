#pragma once

#include <cstdint>
#include <memory>
#include <stop_token>
#include <vector>

#include "internal/model/document.hpp"
#include "internal/model/retrieval_options.hpp"
#include "internal/retrieval/scoring.hpp"
#include "internal/vector/vector_store.hpp"

namespace ragctx::retrieval {

struct RetrievalResult {
  std::vector<model::RetrievedDocument> documents;
  // above the threshold, before truncation
  std::uint32_t total_matches = 0;
  bool          cancelled     = false;
};

/*
  RelevanceRetriever

  Over-fetches from the vector store, drops matches under the relevance
  threshold, applies the promotion boost and returns the best max_results
  documents ordered by boosted score (ties by path).

  Throws util::Unavailable when the vector store fails; never hides a
  backend failure behind an empty result.
*/
class RelevanceRetriever {
 public:
  RelevanceRetriever(std::shared_ptr<vector::VectorStore> store, BoostConfig boosts, std::uint32_t overfetch_factor = 2);

  RetrievalResult Retrieve(const std::vector<float>& embedding, const model::RetrievalOptions& options, std::stop_token stop = {}) const;

 private:
  std::shared_ptr<vector::VectorStore> store_;
  BoostConfig                          boosts_;
  std::uint32_t                        overfetch_factor_;
};

} // namespace ragctx::retrieval
