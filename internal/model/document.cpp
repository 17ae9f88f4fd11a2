#include "internal/model/document.hpp"

#include <algorithm>
#include <cctype>

#include "internal/observability/logging.hpp"

namespace ragctx::model {

namespace {

std::string Lower(std::string_view in) {
  std::string out(in);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

std::optional<PromotionLevel> TryParsePromotionLevel(std::string_view tag) {
  const auto lowered = Lower(tag);
  if (lowered == "standard") return PromotionLevel::kStandard;
  if (lowered == "important" || lowered == "promoted") return PromotionLevel::kImportant;
  if (lowered == "critical" || lowered == "pinned") return PromotionLevel::kCritical;
  return std::nullopt;
}

PromotionLevel ParsePromotionLevel(std::string_view tag, std::string_view path) {
  if (auto level = TryParsePromotionLevel(tag)) {
    return *level;
  }

  RAGCTX_LOG_WARN("unrecognized promotion level, treating as standard",
                  {observability::StringField("tag", tag), observability::StringField("path", path)});
  return PromotionLevel::kStandard;
}

std::string CanonicalPromotionTag(std::string_view tag, std::string_view path) {
  return std::string(ToString(ParsePromotionLevel(tag, path)));
}

std::string TenantKey::Encode() const {
  return project_name + ":" + branch_name + ":" + path_hash;
}

RetrievedDocument FromRecord(const db::model::DocumentRecord& record) {
  RetrievedDocument doc;
  doc.id              = record.id;
  doc.path            = record.path;
  doc.title           = record.title;
  doc.summary         = record.summary;
  doc.content         = record.content;
  doc.char_count      = record.char_count != 0 ? record.char_count : record.content.size();
  doc.doc_type        = record.doc_type;
  doc.promotion_level = ParsePromotionLevel(record.promotion_level, record.path);
  if (record.date_ms != 0) {
    doc.date = util::FromUnixMillis(record.date_ms);
  }
  return doc;
}

} // namespace ragctx::model
