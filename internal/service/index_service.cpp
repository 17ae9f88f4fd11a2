#include "index_service.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/graph/graph_registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/supersession/supersession_tracker.hpp"
#include "internal/util/errors.hpp"

namespace ragctx::service {

using namespace ragctx::v1;
using observability::IntField;
using observability::StringField;

namespace {

void RequirePath(const std::string& path) {
  if (path.empty()) {
    throw util::InvalidArgument("path is required");
  }
}

void RequireDocumentId(const std::string& id) {
  if (id.empty()) {
    throw util::InvalidArgument("document_id is required");
  }
}

std::optional<db::model::DocumentRecord> LookupDocument(db::Repository& repository, const std::string& id) {
  auto tx       = repository.Begin();
  auto document = repository.GetDocumentById(*tx, id);
  tx->Commit();
  return document;
}

ChainIssueKind ToProto(supersession::ChainIssueKind kind) {
  switch (kind) {
    case supersession::ChainIssueKind::kDanglingTarget:
      return CHAIN_ISSUE_KIND_DANGLING_TARGET;
    case supersession::ChainIssueKind::kMissingTarget:
      return CHAIN_ISSUE_KIND_MISSING_TARGET;
    case supersession::ChainIssueKind::kCycle:
      return CHAIN_ISSUE_KIND_CYCLE;
    case supersession::ChainIssueKind::kDepthExceeded:
      return CHAIN_ISSUE_KIND_DEPTH_EXCEEDED;
    case supersession::ChainIssueKind::kBranchedLineage:
      return CHAIN_ISSUE_KIND_BRANCHED_LINEAGE;
  }
  return CHAIN_ISSUE_KIND_UNSPECIFIED;
}

} // namespace

IndexService::IndexService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void IndexService::PublishGraphSize() const {
  observability::Metrics::Instance().SetGraphSize(ctx_.graphs->VertexCount(), ctx_.graphs->EdgeCount());
}

// ------------------------------------------------------------------
// Link graph
// ------------------------------------------------------------------

void IndexService::OnDocumentIndexed(const IndexedDocument& req) {
  ObserveRpc("ragctx.index.document_indexed", req.path(), [&] {
    RequirePath(req.path());
    std::vector<std::string> targets(req.outgoing_links().begin(), req.outgoing_links().end());
    ctx_.graphs->For(FromProto(req.tenant()).Encode())->ReplaceOutgoingEdges(req.path(), targets);
    PublishGraphSize();
  });
}

void IndexService::OnDocumentDeleted(const DocumentDeletedRequest& req) {
  ObserveRpc("ragctx.index.document_deleted", req.path(), [&] {
    RequirePath(req.path());
    const auto tenant_key = FromProto(req.tenant()).Encode();
    const auto graph      = ctx_.graphs->Find(tenant_key);
    if (!graph || !graph->RemoveVertex(req.path())) {
      RAGCTX_LOG_DEBUG("deleted document had no graph vertex", {StringField("path", req.path()), StringField("tenant", tenant_key)});
    }
    PublishGraphSize();
  });
}

FullRebuildResponse IndexService::OnFullRebuild(const FullRebuildRequest& req) {
  return ObserveRpc("ragctx.index.full_rebuild", "", [&] {
    std::vector<graph::DocumentLinks> documents;
    documents.reserve(req.documents_size());
    for (const auto& doc : req.documents()) {
      RequirePath(doc.path());
      documents.push_back({doc.path(), {doc.outgoing_links().begin(), doc.outgoing_links().end()}});
    }

    const auto tenant_key = FromProto(req.tenant()).Encode();
    const auto graph      = ctx_.graphs->For(tenant_key);
    graph->Rebuild(documents);
    PublishGraphSize();

    FullRebuildResponse resp;
    resp.set_vertex_count(graph->VertexCount());
    resp.set_edge_count(graph->EdgeCount());
    RAGCTX_LOG_INFO("link graph rebuilt", {StringField("tenant", tenant_key), IntField("vertices", static_cast<std::int64_t>(resp.vertex_count())),
                                           IntField("edges", static_cast<std::int64_t>(resp.edge_count()))});
    return resp;
  });
}

// ------------------------------------------------------------------
// Supersession
// ------------------------------------------------------------------

SupersessionIndexedResponse IndexService::OnSupersessionIndexed(const SupersessionIndexedRequest& req) {
  return ObserveRpc("ragctx.index.supersession_indexed", req.document_id(), [&] {
    RequireDocumentId(req.document_id());

    const auto document = LookupDocument(*ctx_.repository, req.document_id());

    SupersessionIndexedResponse resp;
    if (!document) {
      resp.set_success(false);
      resp.set_warning("document " + req.document_id() + " is not indexed");
      RAGCTX_LOG_WARN("supersession hook for unknown document", {StringField("document_id", req.document_id())});
      return resp;
    }

    // older declarations may have been waiting for this path to appear
    const auto resolved = ctx_.tracker->ResolveDangling(document->tenant_key, document->path, document->id);
    resp.set_resolved_targets(static_cast<std::uint32_t>(resolved));

    if (!req.has_declared_superseded_path() || req.declared_superseded_path().empty()) {
      resp.set_success(true);
      return resp;
    }

    auto result = ctx_.tracker->Register(req.document_id(), req.declared_superseded_path());
    resp.set_success(result.success);
    resp.set_warning(result.warning);
    resp.set_chain_depth(result.chain_depth);
    return resp;
  });
}

SupersessionDeletedResponse IndexService::OnSupersessionDeleted(const SupersessionDeletedRequest& req) {
  return ObserveRpc("ragctx.index.supersession_deleted", req.document_id(), [&] {
    RequireDocumentId(req.document_id());
    auto result = ctx_.tracker->RemoveFromChain(req.document_id());

    SupersessionDeletedResponse resp;
    resp.set_chain_reconnected(result.chain_reconnected);
    return resp;
  });
}

GetChainResponse IndexService::GetChain(const GetChainRequest& req) {
  return ObserveRpc("ragctx.index.get_chain", req.document_id(), [&] {
    RequireDocumentId(req.document_id());
    if (!LookupDocument(*ctx_.repository, req.document_id())) {
      throw util::NotFound("document " + req.document_id() + " is not indexed");
    }

    GetChainResponse resp;
    for (const auto& id : ctx_.tracker->GetChain(req.document_id())) {
      resp.add_document_ids(id);
    }
    resp.set_current_version_id(ctx_.tracker->GetCurrentVersion(req.document_id()));
    return resp;
  });
}

// ------------------------------------------------------------------
// Validation
// ------------------------------------------------------------------

ValidateCorpusResponse IndexService::ValidateCorpus() {
  return ObserveRpc("ragctx.index.validate", "", [&] {
    ValidateCorpusResponse resp;

    for (const auto& tenant_key : ctx_.graphs->TenantKeys()) {
      for (const auto& cycle : ctx_.graphs->Find(tenant_key)->EnumerateCycles()) {
        auto* out = resp.add_link_cycles();
        out->set_tenant_key(tenant_key);
        for (const auto& path : cycle) {
          out->add_paths(path);
        }
      }
    }

    for (const auto& issue : ctx_.tracker->ValidateAllChains()) {
      auto* out = resp.add_chain_issues();
      out->set_kind(ToProto(issue.kind));
      out->set_document_id(issue.document_id);
      out->set_detail(issue.detail);
    }

    if (resp.link_cycles_size() > 0 || resp.chain_issues_size() > 0) {
      RAGCTX_LOG_WARN("corpus validation found problems", {IntField("link_cycles", resp.link_cycles_size()),
                                                            IntField("chain_issues", resp.chain_issues_size())});
    }
    return resp;
  });
}

} // namespace ragctx::service
