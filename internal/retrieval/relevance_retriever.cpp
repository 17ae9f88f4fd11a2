#include "internal/retrieval/relevance_retriever.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ragctx::retrieval {

RelevanceRetriever::RelevanceRetriever(std::shared_ptr<vector::VectorStore> store, BoostConfig boosts, std::uint32_t overfetch_factor)
    : store_(std::move(store)), boosts_(boosts), overfetch_factor_(std::max<std::uint32_t>(1, overfetch_factor)) {
  if (!store_) {
    throw std::invalid_argument("RelevanceRetriever requires a vector store");
  }
}

RetrievalResult RelevanceRetriever::Retrieve(const std::vector<float>& embedding, const model::RetrievalOptions& options,
                                             std::stop_token stop) const {
  model::ValidateOptions(options);

  vector::VectorSearchFilter filter;
  filter.tenant_key          = options.tenant.Encode();
  filter.min_promotion_level = options.min_promotion_level;
  filter.doc_types           = options.doc_types;

  const auto top_n = static_cast<std::size_t>(options.max_results) * overfetch_factor_;

  std::vector<vector::VectorMatch> matches;
  try {
    matches = store_->Search(embedding, top_n, filter);
  } catch (const util::InvalidArgument&) {
    throw;
  } catch (const util::Unavailable&) {
    throw;
  } catch (const std::exception& e) {
    throw util::Unavailable(std::string("vector store search failed: ") + e.what());
  }

  RetrievalResult result;
  if (stop.stop_requested()) {
    result.cancelled = true;
    return result;
  }

  for (const auto& match : matches) {
    if (match.raw_score < options.min_relevance_score) continue;

    auto doc      = model::FromRecord(match.document);
    doc.raw_score = match.raw_score;
    doc.boosted_score =
        options.apply_relevance_boosting ? ApplyBoost(match.raw_score, doc.promotion_level, boosts_) : match.raw_score;
    doc.final_score = doc.boosted_score;
    result.documents.push_back(std::move(doc));
  }
  result.total_matches = static_cast<std::uint32_t>(result.documents.size());

  std::stable_sort(result.documents.begin(), result.documents.end(), [](const model::RetrievedDocument& a, const model::RetrievedDocument& b) {
    if (a.boosted_score != b.boosted_score) return a.boosted_score > b.boosted_score;
    return a.path < b.path;
  });
  if (result.documents.size() > options.max_results) {
    result.documents.resize(options.max_results);
  }

  RAGCTX_LOG_DEBUG("relevance retrieval finished",
                   {observability::DoubleField("min_score", options.min_relevance_score),
                    observability::IntField("fetched", static_cast<std::int64_t>(matches.size())),
                    observability::IntField("matches", result.total_matches),
                    observability::IntField("returned", static_cast<std::int64_t>(result.documents.size()))});
  return result;
}

} // namespace ragctx::retrieval
