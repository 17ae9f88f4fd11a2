#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/model/document.hpp"

namespace ragctx::config {

namespace rc = ragctx::runtime::config;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static rc::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  rc::RuntimeConfig config;

  // An empty document is a valid config made only of defaults.
  if (yaml.IsDefined() && !yaml.IsNull()) {
    if (!yaml.IsMap()) {
      throw std::runtime_error("Invalid configuration: top level must be a map");
    }

    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

rc::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

rc::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

// ------------------------------------------------------------
// Defaults / validation
// ------------------------------------------------------------

void ApplyDefaults(rc::RuntimeConfig& config) {
  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");

  auto* db = config.mutable_database();
  if (db->backend_case() == rc::DatabaseConfig::BACKEND_NOT_SET) {
    db->mutable_memory();
  }

  auto* retrieval = config.mutable_retrieval();
  if (!retrieval->has_min_relevance_score()) retrieval->set_min_relevance_score(0.7);
  if (retrieval->max_results() == 0) retrieval->set_max_results(10);
  if (!retrieval->has_max_linked_docs()) retrieval->set_max_linked_docs(5);
  if (!retrieval->has_max_link_depth()) retrieval->set_max_link_depth(2);
  if (!retrieval->has_include_critical()) retrieval->set_include_critical(true);
  if (retrieval->min_promotion_level().empty()) retrieval->set_min_promotion_level("standard");
  if (!retrieval->has_apply_relevance_boosting()) retrieval->set_apply_relevance_boosting(true);
  if (retrieval->overfetch_factor() == 0) retrieval->set_overfetch_factor(2);

  auto* scoring = config.mutable_scoring();
  if (!scoring->has_critical_boost()) scoring->set_critical_boost(0.15);
  if (!scoring->has_important_boost()) scoring->set_important_boost(0.10);
  if (!scoring->has_standard_boost()) scoring->set_standard_boost(0.0);

  auto* supersession = config.mutable_supersession();
  if (supersession->max_chain_depth() == 0) supersession->set_max_chain_depth(10);
  if (!supersession->has_decay()) supersession->set_decay(0.5);
}

static void RequireUnitInterval(double value, const char* field) {
  if (!(value >= 0.0 && value <= 1.0)) {
    throw std::runtime_error(std::string("Invalid configuration: ") + field + " must be within [0, 1]");
  }
}

void Validate(const rc::RuntimeConfig& config) {
  const auto& retrieval = config.retrieval();
  RequireUnitInterval(retrieval.min_relevance_score(), "retrieval.min_relevance_score");
  if (retrieval.max_results() < 1) {
    throw std::runtime_error("Invalid configuration: retrieval.max_results must be at least 1");
  }
  if (retrieval.overfetch_factor() < 1) {
    throw std::runtime_error("Invalid configuration: retrieval.overfetch_factor must be at least 1");
  }
  if (!model::TryParsePromotionLevel(retrieval.min_promotion_level())) {
    throw std::runtime_error("Invalid configuration: unknown retrieval.min_promotion_level '" + retrieval.min_promotion_level() + "'");
  }

  const auto& scoring = config.scoring();
  RequireUnitInterval(scoring.critical_boost(), "scoring.critical_boost");
  RequireUnitInterval(scoring.important_boost(), "scoring.important_boost");
  RequireUnitInterval(scoring.standard_boost(), "scoring.standard_boost");

  const auto& supersession = config.supersession();
  if (!(supersession.decay() > 0.0 && supersession.decay() <= 1.0)) {
    throw std::runtime_error("Invalid configuration: supersession.decay must be within (0, 1]");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
}

} // namespace ragctx::config
