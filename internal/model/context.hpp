#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/document.hpp"

namespace ragctx::model {

enum class SourceBucket : std::uint8_t {
  kCritical = 0,
  kDirect   = 1,
  kLinked   = 2,
};

constexpr std::string_view ToString(SourceBucket bucket) {
  switch (bucket) {
    case SourceBucket::kCritical:
      return "critical";
    case SourceBucket::kLinked:
      return "linked";
    case SourceBucket::kDirect:
    default:
      return "direct";
  }
}

struct ContextEntry {
  RetrievedDocument document;
  SourceBucket      bucket = SourceBucket::kDirect;

  // set for kLinked only
  std::string   linked_from;
  std::uint32_t link_depth = 0;
};

/*
  Output of one assembly: critical entries first, then direct by final
  score, then linked by depth. Each path appears at most once.
*/
struct RagContext {
  std::vector<ContextEntry> entries;

  std::uint64_t total_char_count = 0;
  // direct matches above the threshold, before truncation
  std::uint32_t total_matches = 0;

  bool cancelled = false;

  // Markdown rendering handed to the generation step.
  std::string FormatForPrompt() const;
};

} // namespace ragctx::model
