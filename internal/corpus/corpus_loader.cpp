#include "internal/corpus/corpus_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <unordered_set>

#include "internal/db/model/document_record.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "ragctx/v1.hpp"

namespace ragctx::corpus {

using observability::IntField;
using observability::StringField;

namespace {

std::string RequireString(const YAML::Node& node, const char* field, const std::string& where) {
  const auto value = node[field];
  if (!value || !value.IsScalar() || value.Scalar().empty()) {
    throw std::runtime_error("Invalid corpus: " + where + " is missing '" + field + "'");
  }
  return value.Scalar();
}

std::string OptionalString(const YAML::Node& node, const char* field, std::string fallback = {}) {
  const auto value = node[field];
  if (!value || value.IsNull()) {
    return fallback;
  }
  return value.as<std::string>();
}

CorpusDocument ParseDocument(const YAML::Node& node, std::size_t index) {
  if (!node.IsMap()) {
    throw std::runtime_error("Invalid corpus: documents[" + std::to_string(index) + "] must be a map");
  }

  CorpusDocument doc;
  doc.path = RequireString(node, "path", "documents[" + std::to_string(index) + "]");

  const auto where = "document '" + doc.path + "'";
  doc.id           = OptionalString(node, "id", doc.path);
  doc.title        = OptionalString(node, "title", doc.path);
  doc.content      = OptionalString(node, "content");
  doc.doc_type     = OptionalString(node, "doc_type", "note");
  doc.promotion    = OptionalString(node, "promotion", "standard");

  if (node["summary"] && !node["summary"].IsNull()) {
    doc.summary = node["summary"].as<std::string>();
  }
  if (node["date_ms"]) {
    doc.date_ms = node["date_ms"].as<std::uint64_t>();
  }
  if (node["supersedes"] && !node["supersedes"].IsNull()) {
    doc.supersedes = node["supersedes"].as<std::string>();
  }

  if (const auto links = node["links"]) {
    if (!links.IsSequence()) {
      throw std::runtime_error("Invalid corpus: " + where + " links must be a list");
    }
    for (const auto& link : links) {
      doc.links.push_back(link.as<std::string>());
    }
  }

  const auto embedding = node["embedding"];
  if (!embedding || !embedding.IsSequence() || embedding.size() == 0) {
    throw std::runtime_error("Invalid corpus: " + where + " needs a non-empty embedding");
  }
  for (const auto& component : embedding) {
    doc.embedding.push_back(component.as<float>());
  }

  return doc;
}

Corpus ParseCorpus(const YAML::Node& yaml) {
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid corpus: top level must be a map");
  }

  Corpus corpus;
  if (const auto tenant = yaml["tenant"]) {
    corpus.tenant.project_name = OptionalString(tenant, "project");
    corpus.tenant.branch_name  = OptionalString(tenant, "branch");
    corpus.tenant.path_hash    = OptionalString(tenant, "path_hash");
  }

  const auto documents = yaml["documents"];
  if (!documents || !documents.IsSequence()) {
    throw std::runtime_error("Invalid corpus: 'documents' must be a list");
  }

  std::unordered_set<std::string> paths;
  std::unordered_set<std::string> ids;
  for (std::size_t i = 0; i < documents.size(); ++i) {
    auto doc = ParseDocument(documents[i], i);
    if (!paths.insert(doc.path).second) {
      throw std::runtime_error("Invalid corpus: duplicate path '" + doc.path + "'");
    }
    if (!ids.insert(doc.id).second) {
      throw std::runtime_error("Invalid corpus: duplicate id '" + doc.id + "'");
    }
    corpus.documents.push_back(std::move(doc));
  }
  return corpus;
}

db::model::DocumentRecord ToRecord(const CorpusDocument& doc, const std::string& tenant_key, std::uint64_t now_ms) {
  db::model::DocumentRecord record;
  record.id              = doc.id;
  record.tenant_key      = tenant_key;
  record.path            = doc.path;
  record.title           = doc.title;
  record.summary         = doc.summary;
  record.content         = doc.content;
  record.doc_type        = doc.doc_type;
  record.promotion_level = model::CanonicalPromotionTag(doc.promotion, doc.path);
  record.date_ms         = doc.date_ms;
  record.char_count      = doc.content.size();
  record.updated_at_ms   = now_ms;
  return record;
}

} // namespace

Corpus CorpusLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load corpus: " + std::string(e.what()));
  }
  return ParseCorpus(yaml);
}

Corpus CorpusLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse corpus: " + std::string(e.what()));
  }
  return ParseCorpus(yaml);
}

IndexSummary IndexCorpus(const factory::Runtime& runtime, const Corpus& corpus) {
  IndexSummary summary;
  const auto   tenant_key = corpus.tenant.Encode();
  const auto   now_ms     = util::NowMs();

  {
    auto tx = runtime.repository->Begin();
    for (const auto& doc : corpus.documents) {
      auto record = ToRecord(doc, tenant_key, now_ms);
      auto result = runtime.repository->UpsertDocument(*tx, record);
      if (!result) {
        throw std::runtime_error("Failed to index document '" + doc.path + "': " + result.message);
      }
      ++summary.documents;
    }
    tx->Commit();
  }

  ragctx::v1::FullRebuildRequest rebuild;
  rebuild.mutable_tenant()->set_project_name(corpus.tenant.project_name);
  rebuild.mutable_tenant()->set_branch_name(corpus.tenant.branch_name);
  rebuild.mutable_tenant()->set_path_hash(corpus.tenant.path_hash);
  for (const auto& doc : corpus.documents) {
    auto* indexed = rebuild.add_documents();
    indexed->set_path(doc.path);
    for (const auto& link : doc.links) {
      indexed->add_outgoing_links(link);
    }
  }
  auto rebuilt     = runtime.index_service->OnFullRebuild(rebuild);
  summary.vertices = rebuilt.vertex_count();
  summary.edges    = rebuilt.edge_count();

  for (const auto& doc : corpus.documents) {
    ragctx::v1::SupersessionIndexedRequest req;
    req.set_document_id(doc.id);
    if (doc.supersedes) {
      req.set_declared_superseded_path(*doc.supersedes);
    }

    auto resp = runtime.index_service->OnSupersessionIndexed(req);
    if (!doc.supersedes) {
      continue;
    }
    if (resp.success()) {
      ++summary.supersessions;
    } else {
      ++summary.rejected_supersessions;
      RAGCTX_LOG_WARN("supersession rejected", {StringField("document_id", doc.id), StringField("warning", resp.warning())});
    }
  }

  // vectors carry the stored rows, so demotions from the supersession pass reach the retriever
  {
    auto tx = runtime.repository->Begin();
    for (const auto& doc : corpus.documents) {
      auto record = runtime.repository->GetDocumentById(*tx, doc.id);
      if (!record) {
        throw std::runtime_error("Failed to index document '" + doc.path + "': row vanished before vector upsert");
      }
      runtime.vector_store->Upsert(*record, doc.embedding);
    }
    tx->Commit();
  }

  RAGCTX_LOG_INFO("corpus indexed", {IntField("documents", static_cast<std::int64_t>(summary.documents)),
                                     IntField("edges", static_cast<std::int64_t>(summary.edges)),
                                     IntField("supersessions", static_cast<std::int64_t>(summary.supersessions))});
  return summary;
}

} // namespace ragctx::corpus
