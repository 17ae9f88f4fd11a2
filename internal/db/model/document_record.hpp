#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ragctx::db::model {

/*
  Persistent document row, one per (tenant_key, path).

  - id is globally unique and stable across re-indexing of the same path.
  - promotion_level is stored in canonical form ("standard", "important",
    "critical"); repositories normalize aliases and letter case on write.
*/

struct DocumentRecord {
  std::string id;
  std::string tenant_key;
  std::string path;

  std::string                title;
  std::optional<std::string> summary;
  std::string                content;
  std::string                doc_type;
  std::string                promotion_level;

  // epoch ms, 0 = none
  uint64_t date_ms = 0;

  uint64_t char_count    = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace ragctx::db::model
