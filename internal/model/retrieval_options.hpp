#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/document.hpp"

namespace ragctx::model {

/*
  Per-call retrieval options, already resolved against the runtime defaults.
  Immutable for the duration of a call.
*/
struct RetrievalOptions {
  double        min_relevance_score = 0.7;
  std::uint32_t max_results         = 10;
  std::uint32_t max_linked_docs     = 5;
  std::uint32_t max_link_depth      = 2;

  bool           include_critical    = true;
  PromotionLevel min_promotion_level = PromotionLevel::kStandard;

  // empty = every doc type
  std::vector<std::string> doc_types;

  bool apply_relevance_boosting = true;

  TenantKey tenant;
};

// Throws util::InvalidArgument on out-of-range values.
void ValidateOptions(const RetrievalOptions& options);

} // namespace ragctx::model
