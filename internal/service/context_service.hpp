#pragma once

#include <stop_token>

#include "ragctx/v1.hpp"
#include "service_context.hpp"

namespace ragctx::service {

/*
  Query-side entry points. Options left unset on a request take the runtime
  retrieval defaults.
*/
class ContextService {
 public:
  explicit ContextService(ServiceContext ctx);

  ragctx::v1::AssembleContextResponse AssembleContext(const ragctx::v1::AssembleContextRequest& req, std::stop_token stop = {});

  ragctx::v1::RetrieveDocumentsResponse RetrieveRelevantDocuments(const ragctx::v1::RetrieveDocumentsRequest& req, std::stop_token stop = {});

  ragctx::v1::RetrieveWithLinkedResponse RetrieveWithLinkedDocuments(const ragctx::v1::RetrieveDocumentsRequest& req, std::stop_token stop = {});

 private:
  ServiceContext ctx_;
};

} // namespace ragctx::service
