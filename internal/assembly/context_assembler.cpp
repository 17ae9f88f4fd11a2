#include "internal/assembly/context_assembler.hpp"

#include <algorithm>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "internal/observability/logging.hpp"

namespace ragctx::assembly {

using observability::IntField;
using observability::StringField;

namespace {

void SortByFinalScore(std::vector<model::RetrievedDocument>& documents) {
  std::stable_sort(documents.begin(), documents.end(), [](const model::RetrievedDocument& a, const model::RetrievedDocument& b) {
    if (a.final_score != b.final_score) return a.final_score > b.final_score;
    return a.path < b.path;
  });
}

model::RagContext Cancelled() {
  model::RagContext context;
  context.cancelled = true;
  return context;
}

} // namespace

ContextAssembler::ContextAssembler(std::shared_ptr<db::Repository> repository, std::shared_ptr<retrieval::RelevanceRetriever> retriever,
                                   std::shared_ptr<graph::GraphRegistry> graphs, std::shared_ptr<supersession::SupersessionTracker> tracker)
    : repository_(std::move(repository)), retriever_(std::move(retriever)), graphs_(std::move(graphs)), tracker_(std::move(tracker)) {
  if (!repository_ || !retriever_ || !graphs_ || !tracker_) {
    throw std::invalid_argument("ContextAssembler requires repository, retriever, graphs and tracker");
  }
}

std::vector<model::RetrievedDocument> ContextAssembler::FetchCritical(const model::RetrievalOptions& options) const {
  auto tx      = repository_->Begin();
  auto records = repository_->ListDocumentsByPromotion(*tx, options.tenant.Encode(), std::string(model::ToString(model::PromotionLevel::kCritical)));
  tx->Commit();

  std::vector<model::RetrievedDocument> documents;
  documents.reserve(records.size());
  for (const auto& record : records) {
    auto doc = model::FromRecord(record);
    // ranks above any similarity match; the threshold does not apply
    doc.raw_score     = 1.0;
    doc.boosted_score = 1.0;
    doc.final_score   = 1.0;
    documents.push_back(std::move(doc));
  }

  std::stable_sort(documents.begin(), documents.end(), [](const model::RetrievedDocument& a, const model::RetrievedDocument& b) {
    if (a.title != b.title) return a.title < b.title;
    return a.path < b.path;
  });
  return documents;
}

std::vector<model::LinkedDocument> ContextAssembler::ExpandLinks(const std::vector<model::RetrievedDocument>& seeds,
                                                                 const model::RetrievalOptions& options, std::stop_token stop) const {
  const auto tenant_key = options.tenant.Encode();
  const auto graph      = graphs_->Find(tenant_key);
  if (!graph || seeds.empty()) {
    return {};
  }

  std::vector<std::string> start_paths;
  start_paths.reserve(seeds.size());
  for (const auto& seed : seeds) start_paths.push_back(seed.path);

  // hydrate while walking so dangling vertices never take a max_linked_docs slot
  std::unordered_map<std::string, db::model::DocumentRecord> records;
  auto                                                       tx = repository_->Begin();

  const auto hits = graph->Traverse(start_paths, options.max_link_depth, options.max_linked_docs, stop, [&](const std::string& path) {
    auto record = repository_->GetDocumentByPath(*tx, tenant_key, path);
    if (!record) {
      RAGCTX_LOG_DEBUG("skipping dangling link target", {StringField("path", path)});
      return false;
    }
    records.emplace(path, std::move(*record));
    return true;
  });
  tx->Commit();

  std::vector<model::LinkedDocument> linked;
  linked.reserve(hits.size());
  for (const auto& hit : hits) {
    model::LinkedDocument doc;
    static_cast<model::RetrievedDocument&>(doc) = model::FromRecord(records.at(hit.path));
    doc.linked_from                             = hit.referring_path;
    doc.link_depth                              = hit.depth;
    linked.push_back(std::move(doc));
  }
  return linked;
}

bool ContextAssembler::ApplySupersession(std::vector<model::RetrievedDocument>& documents, bool scored, std::stop_token stop) const {
  for (auto& doc : documents) {
    if (stop.stop_requested()) return false;

    auto info = tracker_->GetInfo(doc.id);
    if (scored) {
      doc.final_score = doc.boosted_score * info.multiplier;
    }
    doc.supersession = std::move(info);
  }
  return true;
}

bool ContextAssembler::ApplySupersession(std::vector<model::LinkedDocument>& documents, std::stop_token stop) const {
  for (auto& doc : documents) {
    if (stop.stop_requested()) return false;
    doc.supersession = tracker_->GetInfo(doc.id);
  }
  return true;
}

retrieval::RetrievalResult ContextAssembler::RetrieveRelevant(const std::vector<float>& embedding, const model::RetrievalOptions& options,
                                                              std::stop_token stop) const {
  auto result = retriever_->Retrieve(embedding, options, stop);
  if (result.cancelled) {
    return result;
  }

  if (!ApplySupersession(result.documents, true, stop)) {
    result.documents.clear();
    result.cancelled = true;
    return result;
  }
  SortByFinalScore(result.documents);
  return result;
}

LinkedRetrieval ContextAssembler::RetrieveWithLinked(const std::vector<float>& embedding, const model::RetrievalOptions& options,
                                                     std::stop_token stop) const {
  LinkedRetrieval out;

  auto direct = RetrieveRelevant(embedding, options, stop);
  if (direct.cancelled) {
    out.cancelled = true;
    return out;
  }

  auto linked = ExpandLinks(direct.documents, options, stop);
  if (stop.stop_requested() || !ApplySupersession(linked, stop)) {
    out.cancelled = true;
    return out;
  }

  out.documents     = std::move(direct.documents);
  out.linked        = std::move(linked);
  out.total_matches = direct.total_matches;
  return out;
}

model::RagContext ContextAssembler::Assemble(const std::vector<float>& embedding, const model::RetrievalOptions& options,
                                             std::stop_token stop) const {
  model::ValidateOptions(options);

  // the critical fetch runs beside the retrieval
  std::optional<std::future<std::vector<model::RetrievedDocument>>> critical_future;
  if (options.include_critical) {
    critical_future = std::async(std::launch::async, [this, &options] { return FetchCritical(options); });
  }

  auto direct = retriever_->Retrieve(embedding, options, stop);

  std::vector<model::RetrievedDocument> critical;
  if (critical_future) {
    critical = critical_future->get();
  }

  if (direct.cancelled || stop.stop_requested()) {
    return Cancelled();
  }

  auto linked = ExpandLinks(direct.documents, options, stop);
  if (stop.stop_requested()) {
    return Cancelled();
  }

  if (!ApplySupersession(critical, true, stop) || !ApplySupersession(direct.documents, true, stop) || !ApplySupersession(linked, stop)) {
    return Cancelled();
  }

  // first bucket holding a path wins: critical, direct, linked
  model::RagContext context;
  context.total_matches = direct.total_matches;

  std::unordered_set<std::string> seen;
  for (auto& doc : critical) {
    if (!seen.insert(doc.path).second) continue;
    context.entries.push_back(model::ContextEntry{std::move(doc), model::SourceBucket::kCritical, {}, 0});
  }

  SortByFinalScore(direct.documents);
  for (auto& doc : direct.documents) {
    if (!seen.insert(doc.path).second) continue;
    context.entries.push_back(model::ContextEntry{std::move(doc), model::SourceBucket::kDirect, {}, 0});
  }

  std::stable_sort(linked.begin(), linked.end(), [](const model::LinkedDocument& a, const model::LinkedDocument& b) { return a.link_depth < b.link_depth; });
  for (auto& doc : linked) {
    if (!seen.insert(doc.path).second) continue;
    auto linked_from = doc.linked_from;
    auto link_depth  = doc.link_depth;
    context.entries.push_back(
        model::ContextEntry{static_cast<model::RetrievedDocument&&>(std::move(doc)), model::SourceBucket::kLinked, std::move(linked_from), link_depth});
  }

  for (const auto& entry : context.entries) {
    context.total_char_count += entry.document.char_count;
  }

  RAGCTX_LOG_DEBUG("context assembled", {IntField("entries", static_cast<std::int64_t>(context.entries.size())),
                                         IntField("total_matches", context.total_matches),
                                         IntField("total_chars", static_cast<std::int64_t>(context.total_char_count))});
  return context;
}

} // namespace ragctx::assembly
