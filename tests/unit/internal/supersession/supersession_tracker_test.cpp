#include "internal/supersession/supersession_tracker.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using ragctx::db::memory::MemoryRepository;
using ragctx::db::model::DocumentRecord;
using ragctx::db::model::SupersessionRecord;
using ragctx::supersession::ChainIssueKind;
using ragctx::supersession::SupersessionTracker;
using ragctx::supersession::TrackerConfig;

constexpr const char* kTenant = "demo:main:h1";

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void Index(MemoryRepository& repo, const std::string& id, const std::string& path, const std::string& promotion = "standard") {
  DocumentRecord record;
  record.id              = id;
  record.tenant_key      = kTenant;
  record.path            = path;
  record.title           = id;
  record.content         = "body of " + id;
  record.doc_type        = "note";
  record.promotion_level = promotion;
  record.char_count      = record.content.size();

  auto tx = repo.Begin();
  assert(repo.UpsertDocument(*tx, record));
  tx->Commit();
}

struct Fixture {
  std::shared_ptr<MemoryRepository>    repo;
  std::unique_ptr<SupersessionTracker> tracker;
};

// v1 <- v2 <- v3
Fixture ThreeVersionChain(TrackerConfig config = {}) {
  Fixture f;
  f.repo = std::make_shared<MemoryRepository>();
  Index(*f.repo, "v1", "docs/v1.md");
  Index(*f.repo, "v2", "docs/v2.md");
  Index(*f.repo, "v3", "docs/v3.md");

  f.tracker = std::make_unique<SupersessionTracker>(f.repo, config);
  assert(f.tracker->Register("v2", "docs/v1.md").success);
  assert(f.tracker->Register("v3", "docs/v2.md").success);
  return f;
}

void TestMultiplierDecaysWithDistanceFromCurrent() {
  auto  f       = ThreeVersionChain();
  auto* tracker = f.tracker.get();

  auto oldest = tracker->GetInfo("v1");
  assert(oldest.is_superseded);
  assert(oldest.superseded_by == "v2");
  assert(oldest.current_version_id == "v3");
  assert(oldest.chain_depth == 2);
  assert(Near(oldest.multiplier, 0.25));

  auto middle = tracker->GetInfo("v2");
  assert(middle.supersedes_path == "docs/v1.md");
  assert(middle.chain_depth == 1);
  assert(Near(middle.multiplier, 0.5));

  auto current = tracker->GetInfo("v3");
  assert(!current.is_superseded);
  assert(current.chain_depth == 0);
  assert(Near(current.multiplier, 1.0));
  assert(Near(tracker->Multiplier("v3"), 1.0));

  // documents outside any chain are neutral
  assert(Near(tracker->Multiplier("unrelated"), 1.0));
}

void TestChainListsOldestToNewest() {
  auto  f       = ThreeVersionChain();
  auto* tracker = f.tracker.get();

  const std::vector<std::string> expected{"v1", "v2", "v3"};
  assert(tracker->GetChain("v1") == expected);
  assert(tracker->GetChain("v2") == expected);
  assert(tracker->GetChain("v3") == expected);
  assert(tracker->GetCurrentVersion("v1") == "v3");
  assert(tracker->GetChain("lonely") == std::vector<std::string>{"lonely"});
}

void TestCycleIsRejectedAndNothingPersisted() {
  auto repo = std::make_shared<MemoryRepository>();
  Index(*repo, "a", "docs/a.md");
  Index(*repo, "b", "docs/b.md");
  SupersessionTracker tracker(repo);

  assert(tracker.Register("a", "docs/b.md").success);

  auto second = tracker.Register("b", "docs/a.md");
  assert(!second.success);
  assert(second.warning.find("cycle") != std::string::npos);

  auto tx = repo->Begin();
  assert(!repo->GetSupersession(*tx, "b").has_value());
  tx->Commit();

  auto self = tracker.Register("a", "docs/a.md");
  assert(!self.success);
  assert(self.warning.find("cycle") != std::string::npos);
}

void TestBranchingIsRejected() {
  auto  f       = ThreeVersionChain();
  auto* tracker = f.tracker.get();
  Index(*f.repo, "fork", "docs/fork.md");

  auto result = tracker->Register("fork", "docs/v1.md");
  assert(!result.success);
  assert(result.warning.find("already superseded") != std::string::npos);
  assert(tracker->GetInfo("v1").superseded_by == "v2");
}

void TestUnknownDocumentIsNotRegistered() {
  auto                repo = std::make_shared<MemoryRepository>();
  SupersessionTracker tracker(repo);

  auto result = tracker.Register("ghost", "docs/a.md");
  assert(!result.success);
  assert(!result.warning.empty());
}

void TestDanglingTargetResolvesOnceIndexed() {
  auto repo = std::make_shared<MemoryRepository>();
  Index(*repo, "new", "docs/new.md");
  SupersessionTracker tracker(repo);

  auto result = tracker.Register("new", "docs/old.md");
  assert(result.success);
  assert(result.chain_depth == 1);
  assert(!result.warning.empty());
  assert(tracker.GetInfo("new").supersedes_path == "docs/old.md");

  auto issues = tracker.ValidateAllChains();
  assert(issues.size() == 1);
  assert(issues[0].kind == ChainIssueKind::kDanglingTarget);
  assert(issues[0].document_id == "new");

  Index(*repo, "old", "docs/old.md");
  assert(tracker.ResolveDangling(kTenant, "docs/old.md", "old") == 1);
  assert(tracker.ResolveDangling(kTenant, "docs/old.md", "old") == 0);

  auto old_info = tracker.GetInfo("old");
  assert(old_info.is_superseded);
  assert(old_info.superseded_by == "new");
  assert(Near(old_info.multiplier, 0.5));
  assert(tracker.ValidateAllChains().empty());
}

std::string StoredPromotion(MemoryRepository& repo, const std::string& id) {
  auto tx  = repo.Begin();
  auto doc = repo.GetDocumentById(*tx, id);
  tx->Commit();
  assert(doc.has_value());
  return doc->promotion_level;
}

void TestSupersededDocumentIsDemotedToStandard() {
  auto repo = std::make_shared<MemoryRepository>();
  Index(*repo, "old", "docs/old.md", "critical");
  Index(*repo, "new", "docs/new.md", "critical");
  SupersessionTracker tracker(repo);

  assert(tracker.Register("new", "docs/old.md").success);
  assert(StoredPromotion(*repo, "old") == "standard");
  assert(StoredPromotion(*repo, "new") == "critical");

  // a relationship bound later demotes the same way
  Index(*repo, "draft", "docs/draft.md");
  assert(tracker.Register("draft", "docs/spec.md").success);
  Index(*repo, "spec", "docs/spec.md", "important");
  assert(tracker.ResolveDangling(kTenant, "docs/spec.md", "spec") == 1);
  assert(StoredPromotion(*repo, "spec") == "standard");

  // a rejected registration leaves promotion alone
  Index(*repo, "rival", "docs/rival.md", "critical");
  Index(*repo, "pinned", "docs/pinned.md", "critical");
  assert(!tracker.Register("rival", "docs/old.md").success);
  assert(tracker.Register("pinned", "docs/rival.md").success);
  assert(!tracker.Register("rival", "docs/pinned.md").success);
  assert(StoredPromotion(*repo, "pinned") == "critical");
}

void TestRemoveMiddleReconnectsChain() {
  auto  f       = ThreeVersionChain();
  auto* tracker = f.tracker.get();

  auto removed = tracker->RemoveFromChain("v2");
  assert(removed.chain_reconnected);
  assert(tracker->GetChain("v3") == (std::vector<std::string>{"v1", "v3"}));
  assert(Near(tracker->Multiplier("v1"), 0.5));
  assert(tracker->GetInfo("v3").supersedes_path == "docs/v1.md");
}

void TestRemoveCurrentPromotesPredecessor() {
  auto  f       = ThreeVersionChain();
  auto* tracker = f.tracker.get();

  auto removed = tracker->RemoveFromChain("v3");
  assert(!removed.chain_reconnected);
  assert(tracker->GetCurrentVersion("v1") == "v2");
  assert(Near(tracker->Multiplier("v2"), 1.0));
  assert(Near(tracker->Multiplier("v1"), 0.5));
}

void TestRemoveOldestDetachesSuccessor() {
  auto  f       = ThreeVersionChain();
  auto* tracker = f.tracker.get();

  tracker->RemoveFromChain("v1");
  assert(tracker->GetChain("v3") == (std::vector<std::string>{"v2", "v3"}));
  assert(tracker->GetInfo("v2").supersedes_path.empty());
}

void TestWalksStopAtMaxChainDepth() {
  auto repo = std::make_shared<MemoryRepository>();
  for (int i = 1; i <= 4; ++i) {
    Index(*repo, "d" + std::to_string(i), "docs/d" + std::to_string(i) + ".md");
  }

  TrackerConfig config;
  config.max_chain_depth = 2;
  SupersessionTracker tracker(repo, config);
  assert(tracker.Register("d2", "docs/d1.md").success);
  assert(tracker.Register("d3", "docs/d2.md").success);
  assert(tracker.Register("d4", "docs/d3.md").success);

  auto info = tracker.GetInfo("d1");
  assert(info.chain_depth == 2);
  assert(info.current_version_id == "d3");
  assert(Near(info.multiplier, 0.25));

  auto issues = tracker.ValidateAllChains();
  assert(issues.size() == 1);
  assert(issues[0].kind == ChainIssueKind::kDepthExceeded);
  assert(issues[0].document_id == "d4");
}

void TestStoredCycleIsNeutralizedAndReported() {
  auto repo = std::make_shared<MemoryRepository>();
  Index(*repo, "a", "docs/a.md");
  Index(*repo, "b", "docs/b.md");

  // written behind the tracker's back, as a corrupt store would hold it
  {
    auto tx = repo->Begin();
    assert(repo->UpsertSupersession(*tx, SupersessionRecord{"a", kTenant, "docs/b.md", "b", 1}));
    assert(repo->UpsertSupersession(*tx, SupersessionRecord{"b", kTenant, "docs/a.md", "a", 1}));
    tx->Commit();
  }

  SupersessionTracker tracker(repo);
  auto                info = tracker.GetInfo("a");
  assert(info.cycle_detected);
  assert(Near(info.multiplier, 1.0));

  const auto chain = tracker.GetChain("a");
  assert(chain.size() == 2);

  auto issues = tracker.ValidateAllChains();
  assert(issues.size() == 1);
  assert(issues[0].kind == ChainIssueKind::kCycle);
  assert(issues[0].document_id == "a");
}

void TestMissingTargetIsReported() {
  auto repo = std::make_shared<MemoryRepository>();
  Index(*repo, "old", "docs/old.md");
  Index(*repo, "new", "docs/new.md");
  SupersessionTracker tracker(repo);
  assert(tracker.Register("new", "docs/old.md").success);

  {
    auto tx = repo->Begin();
    assert(repo->DeleteDocument(*tx, kTenant, "docs/old.md"));
    tx->Commit();
  }

  auto issues = tracker.ValidateAllChains();
  assert(issues.size() == 1);
  assert(issues[0].kind == ChainIssueKind::kMissingTarget);
  assert(issues[0].document_id == "new");
}

} // namespace

int main() {
  TestMultiplierDecaysWithDistanceFromCurrent();
  TestChainListsOldestToNewest();
  TestCycleIsRejectedAndNothingPersisted();
  TestBranchingIsRejected();
  TestUnknownDocumentIsNotRegistered();
  TestDanglingTargetResolvesOnceIndexed();
  TestSupersededDocumentIsDemotedToStandard();
  TestRemoveMiddleReconnectsChain();
  TestRemoveCurrentPromotesPredecessor();
  TestRemoveOldestDetachesSuccessor();
  TestWalksStopAtMaxChainDepth();
  TestStoredCycleIsNeutralizedAndReported();
  TestMissingTargetIsReported();

  std::cout << "ragctx_unit_supersession_tracker: pass\n";
  return 0;
}
