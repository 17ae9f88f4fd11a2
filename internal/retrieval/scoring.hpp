#pragma once

#include <algorithm>

#include "internal/model/document.hpp"

namespace ragctx::retrieval {

// Additive boost per promotion level, from ScoringConfig.
struct BoostConfig {
  double critical  = 0.15;
  double important = 0.10;
  double standard  = 0.0;

  double For(model::PromotionLevel level) const {
    switch (level) {
      case model::PromotionLevel::kCritical:
        return critical;
      case model::PromotionLevel::kImportant:
        return important;
      case model::PromotionLevel::kStandard:
      default:
        return standard;
    }
  }
};

inline double ApplyBoost(double raw_score, model::PromotionLevel level, const BoostConfig& boosts) {
  return std::min(1.0, raw_score + boosts.For(level));
}

} // namespace ragctx::retrieval
