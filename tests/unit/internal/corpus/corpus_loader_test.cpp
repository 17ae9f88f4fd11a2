#include "internal/corpus/corpus_loader.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"

namespace {

using ragctx::corpus::CorpusLoader;

constexpr const char* kCorpus = R"(tenant:
  project: demo
  branch: main
  path_hash: 7f3a
documents:
  - id: new
    path: docs/new.md
    title: New
    content: "current text"
    promotion: promoted
    supersedes: docs/old.md
    links: [docs/old.md, docs/missing.md]
    embedding: [1.0, 0.0]
  - id: old
    path: docs/old.md
    content: "old text"
    date_ms: 1700000000000
    embedding: [0.9, 0.1]
  - path: docs/rules.md
    promotion: pinned
    doc_type: policy
    summary: house rules
    embedding: [0.0, 1.0]
)";

bool Rejects(const std::string& yaml) {
  try {
    (void)CorpusLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestParsesDocumentsWithDefaults() {
  auto corpus = CorpusLoader::LoadFromYamlString(kCorpus);
  assert(corpus.tenant.Encode() == "demo:main:7f3a");
  assert(corpus.documents.size() == 3);

  const auto& first = corpus.documents[0];
  assert(first.supersedes == std::optional<std::string>("docs/old.md"));
  assert(first.links.size() == 2);
  assert(first.embedding.size() == 2);

  const auto& old_doc = corpus.documents[1];
  assert(old_doc.title == "docs/old.md");
  assert(old_doc.doc_type == "note");
  assert(old_doc.promotion == "standard");
  assert(old_doc.date_ms == 1700000000000ULL);

  const auto& rules = corpus.documents[2];
  assert(rules.id == "docs/rules.md");
  assert(rules.summary == std::optional<std::string>("house rules"));
}

void TestRejectsMalformedCorpora() {
  assert(Rejects("documents: 3\n"));
  assert(Rejects("documents:\n  - path: a.md\n"));
  assert(Rejects("documents:\n  - path: a.md\n    embedding: []\n"));
  assert(Rejects("documents:\n  - id: x\n    embedding: [1]\n"));
  assert(Rejects("documents:\n  - path: a.md\n    embedding: [1]\n  - path: a.md\n    embedding: [1]\n"));
  assert(Rejects("documents:\n  - path: a.md\n    links: b.md\n    embedding: [1]\n"));
  assert(Rejects("[1, 2]\n"));
}

void TestIndexCorpusDrivesEveryHook() {
  auto rt     = ragctx::factory::Build(ragctx::config::ConfigLoader::LoadFromYamlString(""));
  auto corpus = CorpusLoader::LoadFromYamlString(kCorpus);

  auto summary = ragctx::corpus::IndexCorpus(rt, corpus);
  assert(summary.documents == 3);
  assert(summary.edges == 2);
  assert(summary.vertices == 4);
  assert(summary.supersessions == 1);
  assert(summary.rejected_supersessions == 0);
  assert(rt.vector_store->Size() == 3);
  const auto graph = rt.graphs->Find("demo:main:7f3a");
  assert(graph != nullptr);
  assert(graph->EdgeCount() == 2);

  // every row is written before the hooks run, so a later path still resolves
  assert(rt.tracker->GetCurrentVersion("old") == "new");
  assert(rt.tracker->ValidateAllChains().empty());

  auto tx    = rt.repository->Begin();
  auto rules = rt.repository->GetDocumentByPath(*tx, "demo:main:7f3a", "docs/rules.md");
  auto fresh = rt.repository->GetDocumentById(*tx, "new");
  tx->Commit();
  assert(rules.has_value());
  assert(rules->promotion_level == "critical");
  assert(fresh.has_value());
  assert(fresh->promotion_level == "important");
  assert(fresh->char_count == std::string("current text").size());
}

} // namespace

int main() {
  TestParsesDocumentsWithDefaults();
  TestRejectsMalformedCorpora();
  TestIndexCorpusDrivesEveryHook();

  std::cout << "ragctx_unit_corpus_loader: pass\n";
  return 0;
}
