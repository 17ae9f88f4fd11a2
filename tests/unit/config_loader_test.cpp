#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "ragctx_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ragctx::config::ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\ragctx\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = ragctx::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\ragctx\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = ragctx::config::ConfigLoader::LoadFromYamlString("");

  assert(config.logging().level() == "info");
  assert(config.database().has_memory());

  const auto& retrieval = config.retrieval();
  assert(std::fabs(retrieval.min_relevance_score() - 0.7) < 1e-12);
  assert(retrieval.max_results() == 10);
  assert(retrieval.max_linked_docs() == 5);
  assert(retrieval.max_link_depth() == 2);
  assert(retrieval.include_critical());
  assert(retrieval.min_promotion_level() == "standard");
  assert(retrieval.apply_relevance_boosting());
  assert(retrieval.overfetch_factor() == 2);

  assert(std::fabs(config.scoring().critical_boost() - 0.15) < 1e-12);
  assert(std::fabs(config.scoring().important_boost() - 0.10) < 1e-12);
  assert(config.scoring().standard_boost() == 0.0);

  assert(config.supersession().max_chain_depth() == 10);
  assert(config.supersession().decay() == 0.5);
}

void TestExplicitZeroesSurviveDefaults() {
  auto config = ragctx::config::ConfigLoader::LoadFromYamlString(R"(retrieval:
  min_relevance_score: 0
  max_linked_docs: 0
  max_link_depth: 0
  include_critical: false
  min_promotion_level: pinned
  doc_types: [design, runbook]
scoring:
  critical_boost: 0
observability:
  transport: OTLP_TRANSPORT_HTTP
)");

  const auto& retrieval = config.retrieval();
  assert(retrieval.min_relevance_score() == 0.0);
  assert(retrieval.max_linked_docs() == 0);
  assert(retrieval.max_link_depth() == 0);
  assert(!retrieval.include_critical());
  assert(retrieval.min_promotion_level() == "pinned");
  assert(retrieval.doc_types_size() == 2);
  assert(retrieval.doc_types(1) == "runbook");
  assert(config.scoring().critical_boost() == 0.0);
  assert(config.observability().transport() == ragctx::runtime::config::OTLP_TRANSPORT_HTTP);
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("unknown_field: 123\n") && "ConfigLoader must reject unknown fields.");
  assert(Rejects("retrieval:\n  max_result: 3\n"));
}

void TestOutOfRangeValuesAreRejected() {
  assert(Rejects("retrieval:\n  min_relevance_score: 1.5\n"));
  assert(Rejects("retrieval:\n  min_promotion_level: urgent\n"));
  assert(Rejects("scoring:\n  important_boost: -0.1\n"));
  assert(Rejects("supersession:\n  decay: 0\n"));
  assert(Rejects("database:\n  sqlite:\n    wal_mode: true\n"));
  assert(Rejects("- just\n- a list\n"));
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ragctx::config::ConfigLoader::LoadFromYaml("/nonexistent/ragctx.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestEmptyDocumentYieldsDefaults();
  TestExplicitZeroesSurviveDefaults();
  TestUnknownFieldsAreRejected();
  TestOutOfRangeValuesAreRejected();
  TestMissingFileIsReported();

  std::cout << "ragctx_unit_config_loader: pass\n";
  return 0;
}
