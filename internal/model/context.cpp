#include "internal/model/context.hpp"

#include <sstream>

namespace ragctx::model {

std::string RagContext::FormatForPrompt() const {
  std::ostringstream out;
  bool               first = true;
  for (const auto& entry : entries) {
    if (!first) {
      out << "\n---\n\n";
    }
    first = false;

    const auto& doc = entry.document;
    out << "## " << (doc.title.empty() ? doc.path : doc.title) << "\n";
    out << "Source: " << doc.path << " (" << ToString(entry.bucket);
    if (entry.bucket == SourceBucket::kLinked) {
      out << ", linked from " << entry.linked_from << ", depth " << entry.link_depth;
    }
    out << ")\n";
    if (doc.supersession && doc.supersession->is_superseded) {
      out << "Superseded by: " << doc.supersession->superseded_by << "\n";
    }
    out << "\n" << doc.content << "\n";
  }
  return out.str();
}

} // namespace ragctx::model
