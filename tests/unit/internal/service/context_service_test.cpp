#include "internal/service/context_service.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stop_token>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace ragctx::v1;

ragctx::factory::Runtime MakeRuntime(const std::string& yaml = "") {
  auto rt = ragctx::factory::Build(ragctx::config::ConfigLoader::LoadFromYamlString(yaml));

  auto add = [&](const std::string& id, const std::string& path, const std::string& promotion, const std::string& doc_type,
                 std::vector<float> embedding) {
    ragctx::db::model::DocumentRecord record;
    record.id              = id;
    record.tenant_key      = "p:b:h";
    record.path            = path;
    record.title           = id;
    record.content         = "content of " + id;
    record.doc_type        = doc_type;
    record.promotion_level = promotion;

    auto tx = rt.repository->Begin();
    assert(rt.repository->UpsertDocument(*tx, record));
    tx->Commit();
    rt.vector_store->Upsert(record, std::move(embedding));
  };

  add("guide", "docs/guide.md", "standard", "guide", {1.0f, 0.0f});
  add("design", "docs/design.md", "important", "design", {0.8f, 0.6f});
  add("rules", "docs/rules.md", "critical", "policy", {0.0f, 1.0f});
  add("appendix", "docs/appendix.md", "standard", "guide", {0.0f, 1.0f});

  IndexedDocument links;
  links.set_path("docs/guide.md");
  links.mutable_tenant()->set_project_name("p");
  links.mutable_tenant()->set_branch_name("b");
  links.mutable_tenant()->set_path_hash("h");
  links.add_outgoing_links("docs/appendix.md");
  rt.index_service->OnDocumentIndexed(links);
  return rt;
}

void SetTenant(RetrievalOptions* options) {
  options->mutable_tenant()->set_project_name("p");
  options->mutable_tenant()->set_branch_name("b");
  options->mutable_tenant()->set_path_hash("h");
}

void TestAssembleContextUsesConfigDefaults() {
  auto rt = MakeRuntime();

  AssembleContextRequest req;
  req.add_query_embedding(1.0f);
  req.add_query_embedding(0.0f);
  SetTenant(req.mutable_options());

  auto        resp    = rt.context_service->AssembleContext(req);
  const auto& context = resp.context();
  assert(!context.cancelled());
  // rules (critical), guide (1.0), design (0.8 + 0.10), appendix linked from guide
  assert(context.entries_size() == 4);
  assert(context.entries(0).bucket() == SOURCE_BUCKET_CRITICAL);
  assert(context.entries(0).document().path() == "docs/rules.md");
  assert(context.entries(1).document().path() == "docs/guide.md");
  assert(context.entries(2).document().path() == "docs/design.md");
  assert(std::fabs(context.entries(2).document().boosted_score() - 0.9) < 1e-6);
  assert(context.entries(2).document().promotion_level() == PROMOTION_LEVEL_IMPORTANT);
  assert(context.entries(3).bucket() == SOURCE_BUCKET_LINKED);
  assert(context.entries(3).linked_from() == "docs/guide.md");
  assert(context.entries(3).link_depth() == 1);
  assert(context.total_matches() == 2);
  assert(context.formatted().find("## rules") == 0);
}

void TestRequestOptionsOverrideDefaults() {
  auto rt = MakeRuntime("retrieval:\n  include_critical: false\n");

  AssembleContextRequest req;
  req.add_query_embedding(1.0f);
  req.add_query_embedding(0.0f);
  SetTenant(req.mutable_options());
  req.mutable_options()->set_max_link_depth(0);
  req.mutable_options()->add_doc_types("design");

  auto resp = rt.context_service->AssembleContext(req);
  assert(resp.context().entries_size() == 1);
  assert(resp.context().entries(0).document().path() == "docs/design.md");

  // the request may turn critical injection back on
  req.mutable_options()->set_include_critical(true);
  resp = rt.context_service->AssembleContext(req);
  assert(resp.context().entries_size() == 2);
  assert(resp.context().entries(0).bucket() == SOURCE_BUCKET_CRITICAL);
}

void TestResolveOptionsMergesFieldByField() {
  auto config = ragctx::config::ConfigLoader::LoadFromYamlString("retrieval:\n  max_results: 4\n  min_promotion_level: promoted\n");

  RetrievalOptions request;
  request.set_min_relevance_score(0.2);
  auto options = ragctx::service::ResolveOptions(request, config.retrieval());
  assert(options.min_relevance_score == 0.2);
  assert(options.max_results == 4);
  assert(options.max_linked_docs == 5);
  assert(options.min_promotion_level == ragctx::model::PromotionLevel::kImportant);

  request.set_min_promotion_level(PROMOTION_LEVEL_STANDARD);
  assert(ragctx::service::ResolveOptions(request, config.retrieval()).min_promotion_level == ragctx::model::PromotionLevel::kStandard);

  request.set_max_results(0);
  bool threw = false;
  try {
    ragctx::service::ResolveOptions(request, config.retrieval());
  } catch (const ragctx::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestRetrieveEndpoints() {
  auto rt = MakeRuntime();

  RetrieveDocumentsRequest req;
  req.add_query_embedding(1.0f);
  req.add_query_embedding(0.0f);
  SetTenant(req.mutable_options());

  auto relevant = rt.context_service->RetrieveRelevantDocuments(req);
  assert(!relevant.cancelled());
  assert(relevant.documents_size() == 2);
  assert(relevant.documents(0).path() == "docs/guide.md");
  assert(relevant.documents(0).has_supersession());
  assert(relevant.total_matches() == 2);

  auto with_linked = rt.context_service->RetrieveWithLinkedDocuments(req);
  assert(!with_linked.cancelled());
  assert(with_linked.documents_size() == 2);
  assert(with_linked.linked_documents_size() == 1);
  assert(with_linked.linked_documents(0).document().path() == "docs/appendix.md");
  assert(with_linked.linked_documents(0).bucket() == SOURCE_BUCKET_LINKED);
}

void TestEmptyEmbeddingIsRejected() {
  auto rt = MakeRuntime();

  AssembleContextRequest req;
  SetTenant(req.mutable_options());

  bool threw = false;
  try {
    rt.context_service->AssembleContext(req);
  } catch (const ragctx::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestCancelledRequestReturnsNoEntries() {
  auto rt = MakeRuntime();

  AssembleContextRequest req;
  req.add_query_embedding(1.0f);
  req.add_query_embedding(0.0f);
  SetTenant(req.mutable_options());

  std::stop_source source;
  source.request_stop();
  auto resp = rt.context_service->AssembleContext(req, source.get_token());
  assert(resp.context().cancelled());
  assert(resp.context().entries_size() == 0);
  assert(resp.context().formatted().empty());
}

void TestCancelledRetrievalIsFlagged() {
  auto rt = MakeRuntime();

  RetrieveDocumentsRequest req;
  req.add_query_embedding(1.0f);
  req.add_query_embedding(0.0f);
  SetTenant(req.mutable_options());

  std::stop_source source;
  source.request_stop();

  auto relevant = rt.context_service->RetrieveRelevantDocuments(req, source.get_token());
  assert(relevant.cancelled());
  assert(relevant.documents_size() == 0);

  auto with_linked = rt.context_service->RetrieveWithLinkedDocuments(req, source.get_token());
  assert(with_linked.cancelled());
  assert(with_linked.documents_size() == 0);
  assert(with_linked.linked_documents_size() == 0);

  // nothing above the threshold is an empty, uncancelled answer
  req.mutable_options()->set_min_relevance_score(0.99);
  req.mutable_options()->set_include_critical(false);
  req.clear_query_embedding();
  req.add_query_embedding(-1.0f);
  req.add_query_embedding(-1.0f);
  auto empty = rt.context_service->RetrieveRelevantDocuments(req);
  assert(!empty.cancelled());
  assert(empty.documents_size() == 0);
}

} // namespace

int main() {
  TestAssembleContextUsesConfigDefaults();
  TestRequestOptionsOverrideDefaults();
  TestResolveOptionsMergesFieldByField();
  TestRetrieveEndpoints();
  TestEmptyEmbeddingIsRejected();
  TestCancelledRequestReturnsNoEntries();
  TestCancelledRetrievalIsFlagged();

  std::cout << "ragctx_unit_context_service: pass\n";
  return 0;
}
