#pragma once

#include <cstdint>
#include <memory>
#include <stop_token>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/graph/graph_registry.hpp"
#include "internal/model/context.hpp"
#include "internal/model/document.hpp"
#include "internal/model/retrieval_options.hpp"
#include "internal/retrieval/relevance_retriever.hpp"
#include "internal/supersession/supersession_tracker.hpp"

namespace ragctx::assembly {

struct LinkedRetrieval {
  std::vector<model::RetrievedDocument> documents;
  std::vector<model::LinkedDocument>    linked;
  std::uint32_t                         total_matches = 0;
  bool                                  cancelled     = false;
};

/*
  ContextAssembler

  Builds one RagContext per query:

    critical documents (repository) -------------------------------+
                                                                   +--> supersession --> dedup --> order
    direct matches (retriever) --> link expansion (tenant graph) --+

  The critical fetch and the retrieval run concurrently. Critical and direct
  scores are multiplied by the supersession multiplier; linked documents keep
  their info but no score. A path appears once, in the first of critical,
  direct, linked that holds it.

  A stop request yields cancelled = true and no entries. Vector store or
  repository failures propagate as util::Unavailable.
*/
class ContextAssembler {
 public:
  ContextAssembler(std::shared_ptr<db::Repository> repository, std::shared_ptr<retrieval::RelevanceRetriever> retriever,
                   std::shared_ptr<graph::GraphRegistry> graphs, std::shared_ptr<supersession::SupersessionTracker> tracker);

  model::RagContext Assemble(const std::vector<float>& embedding, const model::RetrievalOptions& options, std::stop_token stop = {}) const;

  // Direct matches with supersession applied and re-ranked. No critical injection, no links.
  retrieval::RetrievalResult RetrieveRelevant(const std::vector<float>& embedding, const model::RetrievalOptions& options,
                                              std::stop_token stop = {}) const;

  LinkedRetrieval RetrieveWithLinked(const std::vector<float>& embedding, const model::RetrievalOptions& options,
                                     std::stop_token stop = {}) const;

 private:
  std::vector<model::RetrievedDocument> FetchCritical(const model::RetrievalOptions& options) const;

  // Hydrated link expansion over the tenant's graph, seeded by `seeds`.
  // Dangling vertices are walked through but never returned or counted.
  std::vector<model::LinkedDocument> ExpandLinks(const std::vector<model::RetrievedDocument>& seeds, const model::RetrievalOptions& options,
                                                 std::stop_token stop) const;

  // Attaches supersession info; multiplies final_score when `scored`. False if stopped first.
  bool ApplySupersession(std::vector<model::RetrievedDocument>& documents, bool scored, std::stop_token stop) const;
  bool ApplySupersession(std::vector<model::LinkedDocument>& documents, std::stop_token stop) const;

  std::shared_ptr<db::Repository>                   repository_;
  std::shared_ptr<retrieval::RelevanceRetriever>    retriever_;
  std::shared_ptr<graph::GraphRegistry>             graphs_;
  std::shared_ptr<supersession::SupersessionTracker> tracker_;
};

} // namespace ragctx::assembly
