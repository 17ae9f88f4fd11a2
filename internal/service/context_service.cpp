#include "context_service.hpp"

#include <cstdint>
#include <utility>
#include <vector>

#include "internal/assembly/context_assembler.hpp"
#include "internal/model/context.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/util/errors.hpp"

namespace ragctx::service {

using namespace ragctx::v1;

namespace {

std::vector<float> Embedding(const google::protobuf::RepeatedField<float>& values) {
  if (values.empty()) {
    throw util::InvalidArgument("query_embedding is required");
  }
  return {values.begin(), values.end()};
}

void RecordBucketSizes(const model::RagContext& context) {
  std::uint64_t critical = 0;
  std::uint64_t direct   = 0;
  std::uint64_t linked   = 0;
  for (const auto& entry : context.entries) {
    switch (entry.bucket) {
      case model::SourceBucket::kCritical:
        ++critical;
        break;
      case model::SourceBucket::kDirect:
        ++direct;
        break;
      case model::SourceBucket::kLinked:
        ++linked;
        break;
    }
  }

  auto& metrics = observability::Metrics::Instance();
  metrics.ObserveCandidateCount("critical", critical);
  metrics.ObserveCandidateCount("direct", direct);
  metrics.ObserveCandidateCount("linked", linked);
  metrics.ObserveContextChars(context.total_char_count);
}

} // namespace

ContextService::ContextService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

AssembleContextResponse ContextService::AssembleContext(const AssembleContextRequest& req, std::stop_token stop) {
  return ObserveRpc("ragctx.context.assemble", req.options().tenant().project_name(), [&] {
    const auto options   = ResolveOptions(req.options(), ctx_.retrieval_defaults);
    const auto embedding = Embedding(req.query_embedding());

    auto context = ctx_.assembler->Assemble(embedding, options, stop);
    if (context.cancelled) {
      RAGCTX_LOG_INFO("context assembly cancelled", {observability::StringField("tenant", options.tenant.Encode())});
    } else {
      RecordBucketSizes(context);
    }

    AssembleContextResponse resp;
    ToProto(context, resp.mutable_context());
    return resp;
  });
}

RetrieveDocumentsResponse ContextService::RetrieveRelevantDocuments(const RetrieveDocumentsRequest& req, std::stop_token stop) {
  return ObserveRpc("ragctx.context.retrieve", req.options().tenant().project_name(), [&] {
    const auto options   = ResolveOptions(req.options(), ctx_.retrieval_defaults);
    const auto embedding = Embedding(req.query_embedding());

    auto result = ctx_.assembler->RetrieveRelevant(embedding, options, stop);

    RetrieveDocumentsResponse resp;
    if (result.cancelled) {
      RAGCTX_LOG_INFO("retrieval cancelled", {observability::StringField("tenant", options.tenant.Encode())});
      resp.set_cancelled(true);
      return resp;
    }
    for (const auto& doc : result.documents) {
      ToProto(doc, resp.add_documents());
    }
    resp.set_total_matches(result.total_matches);
    observability::Metrics::Instance().ObserveCandidateCount("direct", result.documents.size());
    return resp;
  });
}

RetrieveWithLinkedResponse ContextService::RetrieveWithLinkedDocuments(const RetrieveDocumentsRequest& req, std::stop_token stop) {
  return ObserveRpc("ragctx.context.retrieve_linked", req.options().tenant().project_name(), [&] {
    const auto options   = ResolveOptions(req.options(), ctx_.retrieval_defaults);
    const auto embedding = Embedding(req.query_embedding());

    auto result = ctx_.assembler->RetrieveWithLinked(embedding, options, stop);

    RetrieveWithLinkedResponse resp;
    if (result.cancelled) {
      RAGCTX_LOG_INFO("linked retrieval cancelled", {observability::StringField("tenant", options.tenant.Encode())});
      resp.set_cancelled(true);
      return resp;
    }
    for (const auto& doc : result.documents) {
      ToProto(doc, resp.add_documents());
    }
    for (const auto& linked : result.linked) {
      model::ContextEntry entry{linked, model::SourceBucket::kLinked, linked.linked_from, linked.link_depth};
      ToProto(entry, resp.add_linked_documents());
    }
    resp.set_total_matches(result.total_matches);

    auto& metrics = observability::Metrics::Instance();
    metrics.ObserveCandidateCount("direct", result.documents.size());
    metrics.ObserveCandidateCount("linked", result.linked.size());
    return resp;
  });
}

} // namespace ragctx::service
