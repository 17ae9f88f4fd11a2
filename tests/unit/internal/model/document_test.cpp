#include <cassert>
#include <iostream>
#include <string>

#include "internal/model/context.hpp"
#include "internal/model/document.hpp"
#include "internal/model/retrieval_options.hpp"
#include "internal/util/errors.hpp"

namespace {

using ragctx::model::ContextEntry;
using ragctx::model::FromRecord;
using ragctx::model::ParsePromotionLevel;
using ragctx::model::PromotionLevel;
using ragctx::model::RagContext;
using ragctx::model::RetrievalOptions;
using ragctx::model::SourceBucket;
using ragctx::model::TryParsePromotionLevel;

void TestPromotionAliasesParse() {
  assert(TryParsePromotionLevel("standard") == PromotionLevel::kStandard);
  assert(TryParsePromotionLevel("Important") == PromotionLevel::kImportant);
  assert(TryParsePromotionLevel("promoted") == PromotionLevel::kImportant);
  assert(TryParsePromotionLevel("CRITICAL") == PromotionLevel::kCritical);
  assert(TryParsePromotionLevel("pinned") == PromotionLevel::kCritical);
  assert(!TryParsePromotionLevel("urgent").has_value());
  assert(!TryParsePromotionLevel("").has_value());
}

void TestUnknownPromotionFallsBackToStandard() {
  assert(ParsePromotionLevel("urgent", "docs/a.md") == PromotionLevel::kStandard);
  assert(ParsePromotionLevel("pinned") == PromotionLevel::kCritical);
  assert(PromotionLevel::kStandard < PromotionLevel::kImportant);
  assert(PromotionLevel::kImportant < PromotionLevel::kCritical);
}

void TestTenantKeyEncoding() {
  ragctx::model::TenantKey tenant{"proj", "feature/x", "abc"};
  assert(tenant.Encode() == "proj:feature/x:abc");
}

void TestFromRecordCopiesAndParses() {
  ragctx::db::model::DocumentRecord record;
  record.id              = "d1";
  record.path            = "docs/a.md";
  record.title           = "A";
  record.content         = "hello";
  record.promotion_level = "promoted";
  record.date_ms         = 1700000000000;

  auto doc = FromRecord(record);
  assert(doc.id == "d1");
  assert(doc.promotion_level == PromotionLevel::kImportant);
  assert(doc.char_count == 5);
  assert(doc.date.has_value());
  assert(!doc.summary.has_value());
  assert(!doc.supersession.has_value());
}

void TestValidateOptions() {
  RetrievalOptions ok;
  ragctx::model::ValidateOptions(ok);

  auto rejects = [](RetrievalOptions options) {
    try {
      ragctx::model::ValidateOptions(options);
    } catch (const ragctx::util::InvalidArgument&) {
      return true;
    }
    return false;
  };

  RetrievalOptions negative;
  negative.min_relevance_score = -0.01;
  assert(rejects(negative));

  RetrievalOptions zero_results;
  zero_results.max_results = 0;
  assert(rejects(zero_results));

  RetrievalOptions empty_type;
  empty_type.doc_types = {"design", ""};
  assert(rejects(empty_type));
}

void TestFormatForPromptAttributesSources() {
  RagContext context;

  ContextEntry direct;
  direct.document.path    = "docs/a.md";
  direct.document.title   = "Alpha";
  direct.document.content = "alpha body";
  direct.bucket           = SourceBucket::kDirect;

  ContextEntry linked;
  linked.document.path    = "docs/b.md";
  linked.document.content = "beta body";
  linked.bucket           = SourceBucket::kLinked;
  linked.linked_from      = "docs/a.md";
  linked.link_depth       = 2;

  context.entries = {direct, linked};

  const auto text = context.FormatForPrompt();
  assert(text.find("## Alpha\nSource: docs/a.md (direct)\n\nalpha body\n") == 0);
  assert(text.find("\n---\n\n## docs/b.md\n") != std::string::npos);
  assert(text.find("Source: docs/b.md (linked, linked from docs/a.md, depth 2)") != std::string::npos);
  assert(RagContext{}.FormatForPrompt().empty());
}

} // namespace

int main() {
  TestPromotionAliasesParse();
  TestUnknownPromotionFallsBackToStandard();
  TestTenantKeyEncoding();
  TestFromRecordCopiesAndParses();
  TestValidateOptions();
  TestFormatForPromptAttributesSources();

  std::cout << "ragctx_unit_document_model: pass\n";
  return 0;
}
