#pragma once

#include "config/config.pb.h"
#include "internal/model/context.hpp"
#include "internal/model/document.hpp"
#include "internal/model/retrieval_options.hpp"
#include "ragctx/v1.hpp"

namespace ragctx::service {

// Request fields win; anything unset falls back to `defaults`. Throws util::InvalidArgument on bad values.
model::RetrievalOptions ResolveOptions(const ragctx::v1::RetrievalOptions& request, const ragctx::runtime::config::RetrievalConfig& defaults);

model::TenantKey FromProto(const ragctx::v1::TenantKey& tenant);

ragctx::v1::PromotionLevel ToProto(model::PromotionLevel level);
ragctx::v1::SourceBucket   ToProto(model::SourceBucket bucket);

void ToProto(const model::SupersessionInfo& info, ragctx::v1::SupersessionInfo* out);
void ToProto(const model::RetrievedDocument& doc, ragctx::v1::RetrievedDocument* out);
void ToProto(const model::ContextEntry& entry, ragctx::v1::ContextEntry* out);
void ToProto(const model::RagContext& context, ragctx::v1::RagContext* out);

} // namespace ragctx::service
