#include "internal/model/retrieval_options.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace ragctx::model {

void ValidateOptions(const RetrievalOptions& options) {
  if (!(options.min_relevance_score >= 0.0 && options.min_relevance_score <= 1.0)) {
    throw util::InvalidArgument("min_relevance_score must be within [0, 1], got " + std::to_string(options.min_relevance_score));
  }
  if (options.max_results < 1) {
    throw util::InvalidArgument("max_results must be at least 1");
  }
  for (const auto& doc_type : options.doc_types) {
    if (doc_type.empty()) {
      throw util::InvalidArgument("doc_types must not contain empty entries");
    }
  }
}

} // namespace ragctx::model
