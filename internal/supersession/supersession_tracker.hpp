#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/document.hpp"

namespace ragctx::supersession {

struct TrackerConfig {
  std::uint32_t max_chain_depth = 10;
  double        decay           = 0.5;
};

struct RegistrationResult {
  bool          success = false;
  std::string   warning;
  std::uint32_t chain_depth = 0;
};

struct RemovalResult {
  bool chain_reconnected = false;
};

enum class ChainIssueKind {
  kDanglingTarget,
  kMissingTarget,
  kCycle,
  kDepthExceeded,
  kBranchedLineage,
};

struct ChainIssue {
  ChainIssueKind kind;
  std::string    document_id;
  std::string    detail;
};

/*
  SupersessionTracker

  Maintains singly-linked version chains stored as "supersedes" edges in the
  repository: newer ---supersedes---> older. The newest document of a chain is
  its current version.

  Reads never fail on bad data. Walks are iterative, carry a visited set and
  stop at max_chain_depth; a cycle or an over-long chain is logged and the
  walk returns the last node it reached safely. Only a failing repository
  escapes, as util::Unavailable.

  Mutations are serialized by one mutex so read-modify-write sequences on the
  chain never interleave.

  Binding a relationship demotes the superseded document to standard
  promotion in the same transaction, so an outdated critical document stops
  being injected. Removing the relationship later does not restore it.
*/
class SupersessionTracker {
 public:
  SupersessionTracker(std::shared_ptr<db::Repository> repository, TrackerConfig config = {});

  // Records that document_id supersedes the document at superseded_path (same tenant).
  RegistrationResult Register(const std::string& document_id, const std::string& superseded_path);

  model::SupersessionInfo GetInfo(const std::string& document_id) const;

  // Oldest to newest. Always contains document_id.
  std::vector<std::string> GetChain(const std::string& document_id) const;

  std::string GetCurrentVersion(const std::string& document_id) const;

  // Unlinks document_id, splicing its predecessor to its successor when it sat mid-chain.
  RemovalResult RemoveFromChain(const std::string& document_id);

  std::vector<ChainIssue> ValidateAllChains() const;

  // Binds relationships registered against `path` before it was indexed. Returns how many were bound.
  std::size_t ResolveDangling(const std::string& tenant_key, const std::string& path, const std::string& document_id);

  double Multiplier(const std::string& document_id) const;

  const TrackerConfig& Config() const {
    return config_;
  }

 private:
  struct ForwardWalk {
    std::string   current;
    std::uint32_t hops     = 0;
    bool          cycle    = false;
    bool          capped   = false;
    bool          branched = false;
  };

  ForwardWalk WalkForward(db::Transaction& tx, const std::string& document_id) const;
  // True if `from` reaches `needle` by following supersedes edges.
  bool SupersedesTransitively(db::Transaction& tx, const std::string& from, const std::string& needle) const;
  double MultiplierFor(std::uint32_t depth) const;
  void   DemoteSuperseded(db::Transaction& tx, const db::model::DocumentRecord& superseded, const std::string& superseder_id);

  std::shared_ptr<db::Repository> repository_;
  TrackerConfig                   config_;
  std::mutex                      write_mutex_;
};

std::string_view ToString(ChainIssueKind kind);

} // namespace ragctx::supersession
