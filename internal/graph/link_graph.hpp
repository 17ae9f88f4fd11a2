#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <set>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ragctx::graph {

struct TraversalHit {
  std::string   path;
  std::uint32_t depth = 0;
  // vertex this one was first discovered from
  std::string referring_path;
};

struct DocumentLinks {
  std::string              path;
  std::vector<std::string> outgoing_links;
};

struct GraphSnapshot {
  std::vector<std::string>                         vertices;
  std::vector<std::pair<std::string, std::string>> edges;

  bool operator==(const GraphSnapshot&) const = default;
};

/*
  LinkGraph

  Directed graph of document paths. An edge source -> target means the
  document at source links to target. Targets that were never indexed are
  legal (dangling) vertices.

  Both directions are indexed, so incoming and outgoing enumeration cost
  O(degree). Out-edges are kept sorted, which fixes traversal order.

  Cycles are allowed. WouldCreateCycle lets the indexer report them, and
  every traversal carries a visited set so cycles cannot loop it.

  One shared_mutex guards the whole graph: readers share, writers are
  exclusive, and ReplaceOutgoingEdges / Rebuild are each a single critical
  section.
*/
class LinkGraph {
 public:
  void AddVertex(const std::string& path);

  // Removes the vertex and every edge touching it. False if absent.
  bool RemoveVertex(const std::string& path);

  // Atomically swaps the out-edges of `path`. Duplicate targets collapse.
  void ReplaceOutgoingEdges(const std::string& path, const std::vector<std::string>& targets);

  // True if target already reaches source, or source == target.
  bool WouldCreateCycle(const std::string& source, const std::string& target) const;

  // Decides whether a discovered vertex becomes a hit. Called under the read lock.
  using EmitFilter = std::function<bool(const std::string& path)>;

  /*
    Breadth-first from start_paths. Depth is the level of first discovery
    (1 = direct link); start paths are never emitted. Stops after max_depth
    levels or max_count hits. A stop request is honoured between levels and
    returns the levels already completed.

    A vertex rejected by `emittable` is still walked through but is neither
    emitted nor counted against max_count. An empty filter accepts all.
  */
  std::vector<TraversalHit> Traverse(const std::vector<std::string>& start_paths, std::uint32_t max_depth, std::uint32_t max_count,
                                     std::stop_token stop = {}, const EmitFilter& emittable = {}) const;

  std::vector<std::string> IncomingEdges(const std::string& path) const;
  std::vector<std::string> OutgoingEdges(const std::string& path) const;

  // Every strongly connected component with more than one vertex, plus self-loops.
  // Paths within a cycle are sorted, and so is the list of cycles.
  std::vector<std::vector<std::string>> EnumerateCycles() const;

  bool        HasVertex(const std::string& path) const;
  std::size_t VertexCount() const;
  std::size_t EdgeCount() const;

  // Replaces the whole graph in one critical section.
  void Rebuild(const std::vector<DocumentLinks>& documents);

  GraphSnapshot Snapshot() const;

 private:
  using Adjacency = std::unordered_map<std::string, std::set<std::string>>;

  void EnsureVertexLocked(const std::string& path);
  bool ReachesLocked(const std::string& from, const std::string& to) const;

  mutable std::shared_mutex mutex_;
  Adjacency                 out_;
  Adjacency                 in_;
  std::size_t               edge_count_ = 0;
};

} // namespace ragctx::graph
