#include "internal/supersession/supersession_tracker.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ragctx::supersession {

using observability::IntField;
using observability::StringField;

namespace {

void RequireWrite(const db::Result& result, const char* what) {
  if (db::IsBackendFailure(result)) {
    throw util::Unavailable(std::string(what) + ": " + std::string(db::ToString(result.code)) + " " + result.message);
  }
}

} // namespace

std::string_view ToString(ChainIssueKind kind) {
  switch (kind) {
    case ChainIssueKind::kDanglingTarget:
      return "dangling_target";
    case ChainIssueKind::kMissingTarget:
      return "missing_target";
    case ChainIssueKind::kCycle:
      return "cycle";
    case ChainIssueKind::kDepthExceeded:
      return "depth_exceeded";
    case ChainIssueKind::kBranchedLineage:
    default:
      return "branched_lineage";
  }
}

SupersessionTracker::SupersessionTracker(std::shared_ptr<db::Repository> repository, TrackerConfig config)
    : repository_(std::move(repository)), config_(config) {
  if (!repository_) {
    throw std::invalid_argument("SupersessionTracker requires a repository");
  }
  if (config_.max_chain_depth == 0) config_.max_chain_depth = 10;
}

double SupersessionTracker::MultiplierFor(std::uint32_t depth) const {
  return std::pow(config_.decay, static_cast<double>(depth));
}

// ------------------------------------------------------------------
// Walks
// ------------------------------------------------------------------

SupersessionTracker::ForwardWalk SupersessionTracker::WalkForward(db::Transaction& tx, const std::string& document_id) const {
  ForwardWalk walk;
  walk.current = document_id;

  std::unordered_set<std::string> visited{document_id};
  while (true) {
    auto successors = repository_->GetSupersededBy(tx, walk.current);
    if (successors.empty()) break;
    if (successors.size() > 1) walk.branched = true;

    if (walk.hops >= config_.max_chain_depth) {
      walk.capped = true;
      break;
    }

    const auto& next = successors.front().document_id;
    if (!visited.insert(next).second) {
      walk.cycle = true;
      break;
    }
    walk.current = next;
    ++walk.hops;
  }
  return walk;
}

bool SupersessionTracker::SupersedesTransitively(db::Transaction& tx, const std::string& from, const std::string& needle) const {
  std::unordered_set<std::string> visited{from};
  std::string                     cursor = from;
  while (true) {
    if (cursor == needle) return true;

    auto edge = repository_->GetSupersession(tx, cursor);
    if (!edge || !edge->IsResolved()) return false;
    // an existing cycle that does not contain needle
    if (!visited.insert(edge->superseded_document_id).second) return false;
    cursor = edge->superseded_document_id;
  }
}

// ------------------------------------------------------------------
// Registration
// ------------------------------------------------------------------

void SupersessionTracker::DemoteSuperseded(db::Transaction& tx, const db::model::DocumentRecord& superseded, const std::string& superseder_id) {
  const auto level = model::ParsePromotionLevel(superseded.promotion_level, superseded.path);
  if (level == model::PromotionLevel::kStandard) {
    return;
  }

  auto demoted            = superseded;
  demoted.promotion_level = std::string(model::ToString(model::PromotionLevel::kStandard));
  RequireWrite(repository_->UpsertDocument(tx, demoted), "demote superseded document");
  RAGCTX_LOG_INFO("superseded document demoted to standard",
                  {StringField("document_id", superseded.id), StringField("superseded_by", superseder_id),
                   StringField("previous_level", model::ToString(level))});
}

RegistrationResult SupersessionTracker::Register(const std::string& document_id, const std::string& superseded_path) {
  RegistrationResult result;
  if (document_id.empty() || superseded_path.empty()) {
    throw util::InvalidArgument("document_id and superseded_path are required");
  }

  std::scoped_lock lock(write_mutex_);
  auto             tx = repository_->Begin();

  auto document = repository_->GetDocumentById(*tx, document_id);
  if (!document) {
    result.warning = "document " + document_id + " is not indexed";
    RAGCTX_LOG_WARN("supersession skipped: superseding document not indexed", {StringField("document_id", document_id)});
    return result;
  }

  db::model::SupersessionRecord record;
  record.document_id     = document_id;
  record.tenant_key      = document->tenant_key;
  record.superseded_path = superseded_path;
  record.created_at_ms   = util::NowMs();

  auto target = repository_->GetDocumentByPath(*tx, document->tenant_key, superseded_path);
  if (!target) {
    // stored unresolved; ResolveDangling binds it once the path is indexed
    RequireWrite(repository_->UpsertSupersession(*tx, record), "store supersession");
    tx->Commit();

    result.success     = true;
    result.chain_depth = 1;
    result.warning     = "superseded path " + superseded_path + " not found; stored unresolved";
    RAGCTX_LOG_WARN("superseded document not found, relationship stored unresolved",
                    {StringField("document_id", document_id), StringField("superseded_path", superseded_path)});
    return result;
  }

  if (target->id == document_id || SupersedesTransitively(*tx, target->id, document_id)) {
    result.warning = "supersession of " + superseded_path + " by " + document_id + " would create a cycle";
    RAGCTX_LOG_WARN("supersession rejected: cycle", {StringField("document_id", document_id), StringField("superseded_id", target->id)});
    return result;
  }

  for (const auto& existing : repository_->GetSupersededBy(*tx, target->id)) {
    if (existing.document_id != document_id) {
      result.warning = superseded_path + " is already superseded by " + existing.document_id;
      RAGCTX_LOG_WARN("supersession rejected: lineage would branch",
                      {StringField("document_id", document_id), StringField("superseded_id", target->id),
                       StringField("existing_superseder", existing.document_id)});
      return result;
    }
  }

  record.superseded_document_id = target->id;
  RequireWrite(repository_->UpsertSupersession(*tx, record), "store supersession");
  DemoteSuperseded(*tx, *target, document_id);

  const auto walk = WalkForward(*tx, target->id);
  tx->Commit();

  result.success     = true;
  result.chain_depth = walk.hops;
  if (walk.capped) {
    result.warning = "chain exceeds max depth " + std::to_string(config_.max_chain_depth);
    RAGCTX_LOG_WARN("supersession chain exceeds max depth",
                    {StringField("document_id", document_id), IntField("max_chain_depth", config_.max_chain_depth)});
  }

  RAGCTX_LOG_INFO("supersession registered", {StringField("document_id", document_id), StringField("superseded_id", target->id),
                                               IntField("chain_depth", result.chain_depth)});
  return result;
}

std::size_t SupersessionTracker::ResolveDangling(const std::string& tenant_key, const std::string& path, const std::string& document_id) {
  std::scoped_lock lock(write_mutex_);
  auto             tx = repository_->Begin();

  std::size_t resolved = 0;
  for (auto record : repository_->ListUnresolvedSupersessions(*tx, tenant_key, path)) {
    if (record.document_id == document_id || SupersedesTransitively(*tx, document_id, record.document_id)) {
      RAGCTX_LOG_WARN("dangling supersession left unresolved: cycle",
                      {StringField("document_id", record.document_id), StringField("superseded_path", path)});
      continue;
    }

    auto successors = repository_->GetSupersededBy(*tx, document_id);
    if (!successors.empty()) {
      RAGCTX_LOG_WARN("dangling supersession left unresolved: lineage would branch",
                      {StringField("document_id", record.document_id), StringField("existing_superseder", successors.front().document_id)});
      continue;
    }

    record.superseded_document_id = document_id;
    RequireWrite(repository_->UpsertSupersession(*tx, record), "resolve supersession");
    if (auto superseded = repository_->GetDocumentById(*tx, document_id)) {
      DemoteSuperseded(*tx, *superseded, record.document_id);
    }
    ++resolved;
  }

  tx->Commit();
  if (resolved > 0) {
    RAGCTX_LOG_INFO("resolved dangling supersessions",
                    {StringField("path", path), StringField("document_id", document_id), IntField("count", static_cast<std::int64_t>(resolved))});
  }
  return resolved;
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

model::SupersessionInfo SupersessionTracker::GetInfo(const std::string& document_id) const {
  model::SupersessionInfo info;
  info.document_id        = document_id;
  info.current_version_id = document_id;

  auto tx = repository_->Begin();
  if (auto outgoing = repository_->GetSupersession(*tx, document_id)) {
    info.supersedes_path = outgoing->superseded_path;
  }

  auto successors = repository_->GetSupersededBy(*tx, document_id);
  if (!successors.empty()) {
    info.is_superseded = true;
    info.superseded_by = successors.front().document_id;
  }

  const auto walk = WalkForward(*tx, document_id);
  tx->Commit();

  info.current_version_id = walk.current;
  info.chain_depth        = walk.hops;

  if (walk.cycle) {
    info.cycle_detected = true;
    info.multiplier     = 1.0;
    RAGCTX_LOG_WARN("supersession cycle detected, multiplier neutralized", {StringField("document_id", document_id)});
    return info;
  }
  if (walk.capped) {
    RAGCTX_LOG_WARN("supersession chain exceeds max depth",
                    {StringField("document_id", document_id), IntField("max_chain_depth", config_.max_chain_depth)});
  }
  if (walk.branched) {
    RAGCTX_LOG_WARN("supersession lineage is branched", {StringField("document_id", document_id)});
  }

  info.multiplier = MultiplierFor(walk.hops);
  return info;
}

std::vector<std::string> SupersessionTracker::GetChain(const std::string& document_id) const {
  auto tx = repository_->Begin();

  std::unordered_set<std::string> visited{document_id};
  std::vector<std::string>        older;

  std::string cursor = document_id;
  for (std::uint32_t hops = 0; hops < config_.max_chain_depth; ++hops) {
    auto edge = repository_->GetSupersession(*tx, cursor);
    if (!edge || !edge->IsResolved()) break;
    if (!visited.insert(edge->superseded_document_id).second) {
      RAGCTX_LOG_WARN("supersession cycle detected while listing chain", {StringField("document_id", document_id)});
      break;
    }
    cursor = edge->superseded_document_id;
    older.push_back(cursor);
  }

  std::vector<std::string> chain(older.rbegin(), older.rend());
  chain.push_back(document_id);

  cursor = document_id;
  for (std::uint32_t hops = 0; hops < config_.max_chain_depth; ++hops) {
    auto successors = repository_->GetSupersededBy(*tx, cursor);
    if (successors.empty()) break;
    const auto& next = successors.front().document_id;
    if (!visited.insert(next).second) {
      RAGCTX_LOG_WARN("supersession cycle detected while listing chain", {StringField("document_id", document_id)});
      break;
    }
    cursor = next;
    chain.push_back(cursor);
  }

  tx->Commit();
  return chain;
}

std::string SupersessionTracker::GetCurrentVersion(const std::string& document_id) const {
  auto       tx   = repository_->Begin();
  const auto walk = WalkForward(*tx, document_id);
  tx->Commit();

  if (walk.cycle || walk.capped) {
    RAGCTX_LOG_WARN("current version resolution stopped early",
                    {StringField("document_id", document_id), StringField("reached", walk.current), observability::BoolField("cycle", walk.cycle)});
  }
  return walk.current;
}

double SupersessionTracker::Multiplier(const std::string& document_id) const {
  return GetInfo(document_id).multiplier;
}

// ------------------------------------------------------------------
// Removal
// ------------------------------------------------------------------

RemovalResult SupersessionTracker::RemoveFromChain(const std::string& document_id) {
  RemovalResult result;

  std::scoped_lock lock(write_mutex_);
  auto             tx = repository_->Begin();

  auto outgoing   = repository_->GetSupersession(*tx, document_id);
  auto successors = repository_->GetSupersededBy(*tx, document_id);

  if (!successors.empty()) {
    if (outgoing) {
      // middle of the chain: successor now supersedes our predecessor
      std::string predecessor_path = outgoing->superseded_path;
      if (outgoing->IsResolved()) {
        if (auto predecessor = repository_->GetDocumentById(*tx, outgoing->superseded_document_id)) {
          predecessor_path = predecessor->path;
        }
      }
      for (auto successor : successors) {
        successor.superseded_document_id = outgoing->superseded_document_id;
        successor.superseded_path        = predecessor_path;
        RequireWrite(repository_->UpsertSupersession(*tx, successor), "splice supersession chain");
      }
      result.chain_reconnected = true;
    } else {
      // oldest of the chain: nothing left for the successor to supersede
      for (const auto& successor : successors) {
        RequireWrite(repository_->DeleteSupersession(*tx, successor.document_id), "drop supersession");
      }
    }
  }

  if (outgoing) {
    // current version removed: the predecessor becomes current by losing its only successor
    RequireWrite(repository_->DeleteSupersession(*tx, document_id), "drop supersession");
  }

  tx->Commit();

  if (outgoing || !successors.empty()) {
    RAGCTX_LOG_INFO("document removed from supersession chain",
                    {StringField("document_id", document_id), observability::BoolField("reconnected", result.chain_reconnected)});
  }
  return result;
}

// ------------------------------------------------------------------
// Validation
// ------------------------------------------------------------------

std::vector<ChainIssue> SupersessionTracker::ValidateAllChains() const {
  std::vector<ChainIssue> issues;

  auto tx      = repository_->Begin();
  auto records = repository_->ListSupersessions(*tx);

  std::map<std::string, std::string>              supersedes;
  std::map<std::string, std::vector<std::string>> superseded_by;

  for (const auto& record : records) {
    if (!record.IsResolved()) {
      issues.push_back({ChainIssueKind::kDanglingTarget, record.document_id, "superseded path not indexed: " + record.superseded_path});
      continue;
    }
    if (!repository_->GetDocumentById(*tx, record.superseded_document_id)) {
      issues.push_back({ChainIssueKind::kMissingTarget, record.document_id, "superseded document missing: " + record.superseded_document_id});
    }
    supersedes[record.document_id] = record.superseded_document_id;
    superseded_by[record.superseded_document_id].push_back(record.document_id);
  }
  tx->Commit();

  for (const auto& [target, sources] : superseded_by) {
    if (sources.size() > 1) {
      std::string detail = "superseded by";
      for (const auto& source : sources) detail += " " + source;
      issues.push_back({ChainIssueKind::kBranchedLineage, target, detail});
    }
  }

  // every node has at most one outgoing edge, so each walk either ends or closes one cycle
  std::unordered_set<std::string> finished;
  std::unordered_set<std::string> in_cycle;
  for (const auto& [start, _] : supersedes) {
    if (finished.contains(start)) continue;

    std::vector<std::string>                      path;
    std::unordered_map<std::string, std::size_t> position;
    std::string                                   cursor = start;
    while (!finished.contains(cursor)) {
      if (auto seen = position.find(cursor); seen != position.end()) {
        std::vector<std::string> members(path.begin() + static_cast<std::ptrdiff_t>(seen->second), path.end());
        std::sort(members.begin(), members.end());
        std::string detail = "cycle:";
        for (const auto& member : members) {
          detail += " " + member;
          in_cycle.insert(member);
        }
        issues.push_back({ChainIssueKind::kCycle, members.front(), detail});
        break;
      }
      position[cursor] = path.size();
      path.push_back(cursor);

      auto next = supersedes.find(cursor);
      if (next == supersedes.end()) break;
      cursor = next->second;
    }
    finished.insert(path.begin(), path.end());
  }

  // chain heads: superseding documents nobody supersedes
  for (const auto& [head, _] : supersedes) {
    if (superseded_by.contains(head) || in_cycle.contains(head)) continue;

    std::uint32_t depth  = 0;
    std::string   cursor = head;
    for (auto next = supersedes.find(cursor); next != supersedes.end() && !in_cycle.contains(next->second); next = supersedes.find(cursor)) {
      cursor = next->second;
      ++depth;
    }
    if (depth > config_.max_chain_depth) {
      issues.push_back({ChainIssueKind::kDepthExceeded, head,
                        "chain depth " + std::to_string(depth) + " exceeds " + std::to_string(config_.max_chain_depth)});
    }
  }

  std::stable_sort(issues.begin(), issues.end(), [](const ChainIssue& a, const ChainIssue& b) {
    if (a.kind != b.kind) return a.kind < b.kind;
    return a.document_id < b.document_id;
  });

  if (!issues.empty()) {
    RAGCTX_LOG_WARN("supersession validation found issues", {IntField("issues", static_cast<std::int64_t>(issues.size()))});
  }
  return issues;
}

} // namespace ragctx::supersession
