#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/factory.hpp"
#include "internal/model/document.hpp"

namespace ragctx::corpus {

struct CorpusDocument {
  std::string id;
  std::string path;
  std::string title;

  std::optional<std::string> summary;
  std::string                content;
  std::string                doc_type;
  std::string                promotion;

  // epoch ms, 0 = none
  std::uint64_t date_ms = 0;

  std::vector<std::string>   links;
  std::optional<std::string> supersedes;
  std::vector<float>         embedding;
};

struct Corpus {
  model::TenantKey            tenant;
  std::vector<CorpusDocument> documents;
};

struct IndexSummary {
  std::size_t documents             = 0;
  std::size_t vertices              = 0;
  std::size_t edges                 = 0;
  std::size_t supersessions         = 0;
  std::size_t rejected_supersessions = 0;
};

/*
  Loads a corpus fixture: a tenant and a list of documents, each with its
  outgoing links, optional supersession declaration and embedding.

  Throws std::runtime_error naming the offending document on malformed input.
*/
class CorpusLoader {
 public:
  static Corpus LoadFromYaml(const std::string& path);
  static Corpus LoadFromYamlString(const std::string& yaml);
};

/*
  Indexes a corpus the way the external indexer would: document rows and
  vectors first, then a full link graph rebuild, then one supersession hook
  per document in file order.
*/
IndexSummary IndexCorpus(const factory::Runtime& runtime, const Corpus& corpus);

} // namespace ragctx::corpus
