#include "internal/service/proto_convert.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ragctx::service {

namespace v1 = ragctx::v1;

namespace {

model::PromotionLevel FromProto(v1::PromotionLevel level, const std::string& fallback) {
  switch (level) {
    case v1::PROMOTION_LEVEL_STANDARD:
      return model::PromotionLevel::kStandard;
    case v1::PROMOTION_LEVEL_IMPORTANT:
      return model::PromotionLevel::kImportant;
    case v1::PROMOTION_LEVEL_CRITICAL:
      return model::PromotionLevel::kCritical;
    default:
      break;
  }

  auto parsed = model::TryParsePromotionLevel(fallback);
  if (!parsed) {
    throw util::InvalidArgument("unknown promotion level '" + fallback + "'");
  }
  return *parsed;
}

} // namespace

model::TenantKey FromProto(const v1::TenantKey& tenant) {
  model::TenantKey out;
  out.project_name = tenant.project_name();
  out.branch_name  = tenant.branch_name();
  out.path_hash    = tenant.path_hash();
  return out;
}

model::RetrievalOptions ResolveOptions(const v1::RetrievalOptions& request, const ragctx::runtime::config::RetrievalConfig& defaults) {
  model::RetrievalOptions options;

  options.min_relevance_score = request.has_min_relevance_score() ? request.min_relevance_score() : defaults.min_relevance_score();
  options.max_results         = request.has_max_results() ? request.max_results() : defaults.max_results();
  options.max_linked_docs     = request.has_max_linked_docs() ? request.max_linked_docs() : defaults.max_linked_docs();
  options.max_link_depth      = request.has_max_link_depth() ? request.max_link_depth() : defaults.max_link_depth();
  options.include_critical    = request.has_include_critical() ? request.include_critical() : defaults.include_critical();
  options.min_promotion_level = FromProto(request.min_promotion_level(), defaults.min_promotion_level());
  options.apply_relevance_boosting =
      request.has_apply_relevance_boosting() ? request.apply_relevance_boosting() : defaults.apply_relevance_boosting();

  const auto& doc_types = request.doc_types_size() > 0 ? request.doc_types() : defaults.doc_types();
  options.doc_types.assign(doc_types.begin(), doc_types.end());

  options.tenant = FromProto(request.tenant());

  model::ValidateOptions(options);
  return options;
}

v1::PromotionLevel ToProto(model::PromotionLevel level) {
  switch (level) {
    case model::PromotionLevel::kImportant:
      return v1::PROMOTION_LEVEL_IMPORTANT;
    case model::PromotionLevel::kCritical:
      return v1::PROMOTION_LEVEL_CRITICAL;
    case model::PromotionLevel::kStandard:
    default:
      return v1::PROMOTION_LEVEL_STANDARD;
  }
}

v1::SourceBucket ToProto(model::SourceBucket bucket) {
  switch (bucket) {
    case model::SourceBucket::kCritical:
      return v1::SOURCE_BUCKET_CRITICAL;
    case model::SourceBucket::kLinked:
      return v1::SOURCE_BUCKET_LINKED;
    case model::SourceBucket::kDirect:
    default:
      return v1::SOURCE_BUCKET_DIRECT;
  }
}

void ToProto(const model::SupersessionInfo& info, v1::SupersessionInfo* out) {
  out->set_document_id(info.document_id);
  out->set_is_superseded(info.is_superseded);
  out->set_superseded_by(info.superseded_by);
  out->set_supersedes_path(info.supersedes_path);
  out->set_current_version_id(info.current_version_id);
  out->set_chain_depth(info.chain_depth);
  out->set_multiplier(info.multiplier);
  out->set_cycle_detected(info.cycle_detected);
}

void ToProto(const model::RetrievedDocument& doc, v1::RetrievedDocument* out) {
  out->set_id(doc.id);
  out->set_path(doc.path);
  out->set_title(doc.title);
  if (doc.summary) {
    out->set_summary(*doc.summary);
  }
  out->set_content(doc.content);
  out->set_char_count(doc.char_count);
  out->set_doc_type(doc.doc_type);
  out->set_promotion_level(ToProto(doc.promotion_level));
  out->set_raw_score(doc.raw_score);
  out->set_boosted_score(doc.boosted_score);
  out->set_final_score(doc.final_score);
  if (doc.date) {
    *out->mutable_date() = util::ToProto(*doc.date);
  }
  if (doc.supersession) {
    ToProto(*doc.supersession, out->mutable_supersession());
  }
}

void ToProto(const model::ContextEntry& entry, v1::ContextEntry* out) {
  ToProto(entry.document, out->mutable_document());
  out->set_bucket(ToProto(entry.bucket));
  out->set_linked_from(entry.linked_from);
  out->set_link_depth(entry.link_depth);
}

void ToProto(const model::RagContext& context, v1::RagContext* out) {
  for (const auto& entry : context.entries) {
    ToProto(entry, out->add_entries());
  }
  out->set_total_char_count(context.total_char_count);
  out->set_total_matches(context.total_matches);
  out->set_cancelled(context.cancelled);
  if (!context.cancelled) {
    out->set_formatted(context.FormatForPrompt());
  }
}

} // namespace ragctx::service
