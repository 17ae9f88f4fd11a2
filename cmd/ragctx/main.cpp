#include <google/protobuf/util/json_util.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <stop_token>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/corpus/corpus_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "ragctx/v1.hpp"

using namespace ragctx::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  ragctx <config.yaml> <corpus.yaml> query <e1,e2,...> [options] [format=markdown]\n"
            << "  ragctx <config.yaml> <corpus.yaml> search <e1,e2,...> [options]\n"
            << "  ragctx <config.yaml> <corpus.yaml> related <e1,e2,...> [options]\n"
            << "  ragctx <config.yaml> <corpus.yaml> chain <document_id>\n"
            << "  ragctx <config.yaml> <corpus.yaml> validate\n"
            << "\n"
            << "Options (key=value): min_score, max_results, max_linked, depth, critical=true|false,\n"
            << "  boost=true|false, min_promotion=standard|important|critical, doc_type (repeatable)\n";
}

static std::vector<float> ParseEmbedding(const std::string& text) {
  std::vector<float> values;
  std::stringstream  in(text);
  std::string        item;
  while (std::getline(in, item, ',')) {
    char*       end   = nullptr;
    const float value = std::strtof(item.c_str(), &end);
    if (item.empty() || end == nullptr || *end != '\0') {
      throw ragctx::util::InvalidArgument("invalid embedding component '" + item + "'");
    }
    values.push_back(value);
  }
  return values;
}

static bool ParseBool(const std::string& key, const std::string& value) {
  if (value == "true") return true;
  if (value == "false") return false;
  throw ragctx::util::InvalidArgument(key + " must be true or false");
}

static std::optional<PromotionLevel> ParsePromotion(const std::string& value) {
  if (value == "standard") return PROMOTION_LEVEL_STANDARD;
  if (value == "important") return PROMOTION_LEVEL_IMPORTANT;
  if (value == "critical") return PROMOTION_LEVEL_CRITICAL;
  return std::nullopt;
}

// Applies key=value arguments from argv[first] on. Returns the requested output format.
static std::string ParseOptions(int argc, char** argv, int first, RetrievalOptions* options) {
  std::string format = "json";
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto        eq  = arg.find('=');
    if (eq == std::string::npos) {
      throw ragctx::util::InvalidArgument("expected key=value, got '" + arg + "'");
    }
    const auto key   = arg.substr(0, eq);
    const auto value = arg.substr(eq + 1);

    if (key == "min_score") {
      options->set_min_relevance_score(std::stod(value));
    } else if (key == "max_results") {
      options->set_max_results(static_cast<uint32_t>(std::stoul(value)));
    } else if (key == "max_linked") {
      options->set_max_linked_docs(static_cast<uint32_t>(std::stoul(value)));
    } else if (key == "depth") {
      options->set_max_link_depth(static_cast<uint32_t>(std::stoul(value)));
    } else if (key == "critical") {
      options->set_include_critical(ParseBool(key, value));
    } else if (key == "boost") {
      options->set_apply_relevance_boosting(ParseBool(key, value));
    } else if (key == "min_promotion") {
      auto level = ParsePromotion(value);
      if (!level) {
        throw ragctx::util::InvalidArgument("unknown promotion level '" + value + "'");
      }
      options->set_min_promotion_level(*level);
    } else if (key == "doc_type") {
      options->add_doc_types(value);
    } else if (key == "format") {
      format = value;
    } else {
      throw ragctx::util::InvalidArgument("unknown option '" + key + "'");
    }
  }
  return format;
}

static void PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to render JSON: " + std::string(status.message()));
  }
  std::cout << json << "\n";
}

static std::stop_source g_stop;

void HandleSignal(int) {
  g_stop.request_stop();
}

static int Run(int argc, char** argv) {
  const std::string config_path = argv[1];
  const std::string corpus_path = argv[2];
  const std::string cmd         = argv[3];

  auto config = ragctx::config::ConfigLoader::LoadFromYaml(config_path);

  ragctx::observability::InitializeTracing(config);
  ragctx::observability::InitializeMetrics(config);
  ragctx::observability::InitializeLogging(config);

  auto runtime = ragctx::factory::Build(config);
  auto corpus  = ragctx::corpus::CorpusLoader::LoadFromYaml(corpus_path);
  ragctx::corpus::IndexCorpus(runtime, corpus);

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  auto set_tenant = [&](RetrievalOptions* options) {
    options->mutable_tenant()->set_project_name(corpus.tenant.project_name);
    options->mutable_tenant()->set_branch_name(corpus.tenant.branch_name);
    options->mutable_tenant()->set_path_hash(corpus.tenant.path_hash);
  };

  // ------------------------------------------------------------

  if (cmd == "query") {
    if (argc < 5) return 1;

    AssembleContextRequest req;
    for (float v : ParseEmbedding(argv[4])) req.add_query_embedding(v);
    set_tenant(req.mutable_options());
    const auto format = ParseOptions(argc, argv, 5, req.mutable_options());

    auto resp = runtime.context_service->AssembleContext(req, g_stop.get_token());
    if (format == "markdown") {
      std::cout << resp.context().formatted();
    } else {
      PrintJson(resp);
    }
    return resp.context().cancelled() ? 3 : 0;
  }

  // ------------------------------------------------------------

  if (cmd == "search" || cmd == "related") {
    if (argc < 5) return 1;

    RetrieveDocumentsRequest req;
    for (float v : ParseEmbedding(argv[4])) req.add_query_embedding(v);
    set_tenant(req.mutable_options());
    ParseOptions(argc, argv, 5, req.mutable_options());

    if (cmd == "search") {
      auto resp = runtime.context_service->RetrieveRelevantDocuments(req, g_stop.get_token());
      PrintJson(resp);
      return resp.cancelled() ? 3 : 0;
    }
    auto resp = runtime.context_service->RetrieveWithLinkedDocuments(req, g_stop.get_token());
    PrintJson(resp);
    return resp.cancelled() ? 3 : 0;
  }

  // ------------------------------------------------------------

  if (cmd == "chain") {
    if (argc < 5) return 1;

    GetChainRequest req;
    req.set_document_id(argv[4]);
    PrintJson(runtime.index_service->GetChain(req));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "validate") {
    auto resp = runtime.index_service->ValidateCorpus();
    PrintJson(resp);
    return (resp.link_cycles_size() > 0 || resp.chain_issues_size() > 0) ? 4 : 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  int rc = 0;
  try {
    rc = Run(argc, argv);
  } catch (const ragctx::util::InvalidArgument& e) {
    std::cerr << "invalid argument: " << e.what() << "\n";
    rc = 1;
  } catch (const ragctx::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
    rc = 1;
  } catch (const std::exception& e) {
    RAGCTX_LOG_ERROR("Fatal error", {ragctx::observability::StringField("error", e.what())});
    rc = 2;
  }

  ragctx::observability::ShutdownLogging();
  ragctx::observability::ShutdownMetrics();
  ragctx::observability::ShutdownTracing();
  return rc;
}
