#pragma once

#include "ragctx/v1.hpp"
#include "service_context.hpp"

namespace ragctx::service {

/*
  Maintenance hooks driven by the indexer. Keeps the link graph and the
  supersession relationships in step with the indexed corpus.
*/
class IndexService {
 public:
  explicit IndexService(ServiceContext ctx);

  void OnDocumentIndexed(const ragctx::v1::IndexedDocument& req);

  void OnDocumentDeleted(const ragctx::v1::DocumentDeletedRequest& req);

  ragctx::v1::FullRebuildResponse OnFullRebuild(const ragctx::v1::FullRebuildRequest& req);

  ragctx::v1::SupersessionIndexedResponse OnSupersessionIndexed(const ragctx::v1::SupersessionIndexedRequest& req);

  ragctx::v1::SupersessionDeletedResponse OnSupersessionDeleted(const ragctx::v1::SupersessionDeletedRequest& req);

  ragctx::v1::GetChainResponse GetChain(const ragctx::v1::GetChainRequest& req);

  ragctx::v1::ValidateCorpusResponse ValidateCorpus();

 private:
  void PublishGraphSize() const;

  ServiceContext ctx_;
};

} // namespace ragctx::service
