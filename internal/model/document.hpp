#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/model/document_record.hpp"
#include "internal/util/time.hpp"

namespace ragctx::model {

enum class PromotionLevel : std::uint8_t {
  kStandard  = 0,
  kImportant = 1,
  kCritical  = 2,
};

constexpr std::string_view ToString(PromotionLevel level) {
  switch (level) {
    case PromotionLevel::kImportant:
      return "important";
    case PromotionLevel::kCritical:
      return "critical";
    case PromotionLevel::kStandard:
    default:
      return "standard";
  }
}

// Case-insensitive. Accepts "promoted" for important and "pinned" for critical.
std::optional<PromotionLevel> TryParsePromotionLevel(std::string_view tag);

// Same as TryParsePromotionLevel, but anything unrecognized is standard with a warning.
PromotionLevel ParsePromotionLevel(std::string_view tag, std::string_view path = {});

// The spelling repositories store: "pinned" and "Critical" both become "critical".
std::string CanonicalPromotionTag(std::string_view tag, std::string_view path = {});

/*
  Tenant scope of a query: project, branch and a hash of the repository root.
  Encoded as "project:branch:path_hash" wherever a single key column is needed.
*/
struct TenantKey {
  std::string project_name;
  std::string branch_name;
  std::string path_hash;

  std::string Encode() const;

  bool operator==(const TenantKey&) const = default;
};

struct SupersessionInfo {
  std::string document_id;

  bool        is_superseded = false;
  std::string superseded_by;
  std::string supersedes_path;
  std::string current_version_id;

  // Hops from this document to the current version. 0 = current.
  std::uint32_t chain_depth = 0;
  double        multiplier  = 1.0;

  bool cycle_detected = false;
};

struct RetrievedDocument {
  std::string id;
  std::string path;
  std::string title;

  std::optional<std::string> summary;
  std::string                content;
  std::uint64_t              char_count = 0;

  std::string    doc_type;
  PromotionLevel promotion_level = PromotionLevel::kStandard;

  double raw_score     = 0.0;
  double boosted_score = 0.0;
  // boosted_score after the supersession multiplier
  double final_score = 0.0;

  std::optional<util::TimePoint> date;

  std::optional<SupersessionInfo> supersession;
};

// Reached through the link graph, never through similarity, so raw_score stays 0.
struct LinkedDocument : RetrievedDocument {
  std::string   linked_from;
  std::uint32_t link_depth = 1;
};

RetrievedDocument FromRecord(const db::model::DocumentRecord& record);

} // namespace ragctx::model
