#include "internal/graph/link_graph.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

namespace {

using ragctx::graph::DocumentLinks;
using ragctx::graph::LinkGraph;
using ragctx::graph::TraversalHit;

const TraversalHit* FindHit(const std::vector<TraversalHit>& hits, const std::string& path) {
  auto it = std::find_if(hits.begin(), hits.end(), [&](const TraversalHit& hit) { return hit.path == path; });
  return it == hits.end() ? nullptr : &*it;
}

void TestTraversalRespectsMaxDepth() {
  LinkGraph graph;
  graph.ReplaceOutgoingEdges("a.md", {"b.md"});
  graph.ReplaceOutgoingEdges("b.md", {"c.md"});

  const auto shallow = graph.Traverse({"a.md"}, 1, 10);
  assert(shallow.size() == 1);
  assert(shallow[0].path == "b.md");
  assert(shallow[0].depth == 1);
  assert(shallow[0].referring_path == "a.md");

  const auto deep = graph.Traverse({"a.md"}, 2, 10);
  assert(deep.size() == 2);
  const auto* c = FindHit(deep, "c.md");
  assert(c != nullptr);
  assert(c->depth == 2);
  assert(c->referring_path == "b.md");
}

void TestDepthIsFirstDiscoveryLevel() {
  LinkGraph graph;
  // c is one hop from a and also two hops via b; it must be reported at depth 1
  graph.ReplaceOutgoingEdges("a.md", {"b.md", "c.md"});
  graph.ReplaceOutgoingEdges("b.md", {"c.md", "d.md"});

  const auto hits = graph.Traverse({"a.md"}, 5, 10);
  assert(hits.size() == 3);
  assert(FindHit(hits, "c.md")->depth == 1);
  assert(FindHit(hits, "d.md")->depth == 2);
}

void TestCyclicTraversalTerminatesWithoutDuplicates() {
  LinkGraph graph;
  graph.ReplaceOutgoingEdges("a.md", {"b.md"});
  graph.ReplaceOutgoingEdges("b.md", {"c.md"});
  graph.ReplaceOutgoingEdges("c.md", {"a.md", "d.md"});
  graph.ReplaceOutgoingEdges("d.md", {"d.md"});

  const auto hits = graph.Traverse({"a.md"}, 5, 100);
  std::set<std::string> unique;
  for (const auto& hit : hits) {
    assert(unique.insert(hit.path).second);
  }
  // start paths are never emitted, even when a cycle leads back to them
  assert(!unique.contains("a.md"));
  assert(unique == (std::set<std::string>{"b.md", "c.md", "d.md"}));
}

void TestTraversalStopsAtMaxCount() {
  LinkGraph graph;
  graph.ReplaceOutgoingEdges("hub.md", {"1.md", "2.md", "3.md", "4.md"});

  const auto hits = graph.Traverse({"hub.md"}, 3, 2);
  assert(hits.size() == 2);
  // out-edges are ordered, so the first two targets win
  assert(hits[0].path == "1.md");
  assert(hits[1].path == "2.md");

  assert(graph.Traverse({"hub.md"}, 0, 10).empty());
  assert(graph.Traverse({"hub.md"}, 3, 0).empty());
}

void TestTraversalHonoursStopRequest() {
  LinkGraph graph;
  graph.ReplaceOutgoingEdges("a.md", {"b.md"});

  std::stop_source source;
  source.request_stop();
  assert(graph.Traverse({"a.md"}, 3, 10, source.get_token()).empty());
}

void TestRejectedVerticesAreWalkedButNotCounted() {
  LinkGraph graph;
  graph.ReplaceOutgoingEdges("a.md", {"a_missing.md", "b.md"});
  graph.ReplaceOutgoingEdges("a_missing.md", {"c.md"});
  const auto indexed = [](const std::string& path) { return path != "a_missing.md"; };

  auto first = graph.Traverse({"a.md"}, 1, 1, {}, indexed);
  assert(first.size() == 1);
  assert(first[0].path == "b.md");

  // without a filter the dangling vertex takes the only slot
  auto unfiltered = graph.Traverse({"a.md"}, 1, 1);
  assert(unfiltered.size() == 1);
  assert(unfiltered[0].path == "a_missing.md");

  auto deep = graph.Traverse({"a.md"}, 2, 10, {}, indexed);
  assert(deep.size() == 2);
  assert(FindHit(deep, "a_missing.md") == nullptr);
  const auto* c = FindHit(deep, "c.md");
  assert(c != nullptr);
  assert(c->depth == 2);
  assert(c->referring_path == "a_missing.md");
}

void TestReplaceOutgoingEdgesRemovesStaleIncoming() {
  LinkGraph graph;
  graph.ReplaceOutgoingEdges("a.md", {"b.md", "c.md"});
  assert(graph.IncomingEdges("b.md") == std::vector<std::string>{"a.md"});
  assert(graph.EdgeCount() == 2);

  graph.ReplaceOutgoingEdges("a.md", {"c.md", "c.md"});
  assert(graph.IncomingEdges("b.md").empty());
  assert(graph.IncomingEdges("c.md") == std::vector<std::string>{"a.md"});
  assert(graph.OutgoingEdges("a.md") == std::vector<std::string>{"c.md"});
  assert(graph.EdgeCount() == 1);
  // targets stay as dangling vertices
  assert(graph.HasVertex("b.md"));
}

void TestRemoveVertexCascadesBothDirections() {
  LinkGraph graph;
  graph.ReplaceOutgoingEdges("a.md", {"b.md"});
  graph.ReplaceOutgoingEdges("b.md", {"c.md", "b.md"});
  graph.ReplaceOutgoingEdges("c.md", {"b.md"});
  assert(graph.EdgeCount() == 4);

  assert(graph.RemoveVertex("b.md"));
  assert(!graph.HasVertex("b.md"));
  assert(graph.OutgoingEdges("a.md").empty());
  assert(graph.OutgoingEdges("c.md").empty());
  assert(graph.IncomingEdges("c.md").empty());
  assert(graph.EdgeCount() == 0);
  assert(graph.VertexCount() == 2);

  assert(!graph.RemoveVertex("b.md"));
}

void TestAddVertexIsIdempotentAndKeepsEdges() {
  LinkGraph graph;
  graph.AddVertex("lonely.md");
  assert(graph.HasVertex("lonely.md"));
  assert(graph.VertexCount() == 1);
  assert(graph.EdgeCount() == 0);

  graph.ReplaceOutgoingEdges("a.md", {"lonely.md"});
  graph.AddVertex("a.md");
  graph.AddVertex("lonely.md");
  assert(graph.VertexCount() == 2);
  assert(graph.OutgoingEdges("a.md") == std::vector<std::string>{"lonely.md"});
  assert(graph.IncomingEdges("lonely.md") == std::vector<std::string>{"a.md"});
}

void TestWouldCreateCycle() {
  LinkGraph graph;
  graph.ReplaceOutgoingEdges("a.md", {"b.md"});
  graph.ReplaceOutgoingEdges("b.md", {"c.md"});

  assert(graph.WouldCreateCycle("c.md", "a.md"));
  assert(graph.WouldCreateCycle("a.md", "a.md"));
  assert(!graph.WouldCreateCycle("a.md", "c.md"));
  assert(!graph.WouldCreateCycle("x.md", "a.md"));
}

void TestEnumerateCyclesReportsLoopsOnly() {
  LinkGraph graph;
  graph.ReplaceOutgoingEdges("a.md", {"b.md"});
  graph.ReplaceOutgoingEdges("b.md", {"c.md"});
  graph.ReplaceOutgoingEdges("c.md", {"a.md"});
  graph.ReplaceOutgoingEdges("self.md", {"self.md"});
  graph.ReplaceOutgoingEdges("x.md", {"y.md"});
  graph.ReplaceOutgoingEdges("y.md", {"z.md"});

  const auto cycles = graph.EnumerateCycles();
  assert(cycles.size() == 2);
  assert(cycles[0] == (std::vector<std::string>{"a.md", "b.md", "c.md"}));
  assert(cycles[1] == std::vector<std::string>{"self.md"});
}

void TestRebuildIsDeterministic() {
  const std::vector<DocumentLinks> documents = {
      {"a.md", {"b.md", "missing.md"}},
      {"b.md", {"a.md"}},
      {"c.md", {}},
  };

  LinkGraph graph;
  graph.ReplaceOutgoingEdges("stale.md", {"a.md"});

  graph.Rebuild(documents);
  const auto first = graph.Snapshot();
  graph.Rebuild(documents);
  const auto second = graph.Snapshot();

  assert(first == second);
  assert(!graph.HasVertex("stale.md"));
  assert(first.vertices == (std::vector<std::string>{"a.md", "b.md", "c.md", "missing.md"}));
  assert(first.edges.size() == 3);
  assert(graph.EdgeCount() == 3);
  assert(graph.IncomingEdges("a.md") == std::vector<std::string>{"b.md"});
}

} // namespace

int main() {
  TestTraversalRespectsMaxDepth();
  TestDepthIsFirstDiscoveryLevel();
  TestCyclicTraversalTerminatesWithoutDuplicates();
  TestTraversalStopsAtMaxCount();
  TestTraversalHonoursStopRequest();
  TestRejectedVerticesAreWalkedButNotCounted();
  TestReplaceOutgoingEdgesRemovesStaleIncoming();
  TestRemoveVertexCascadesBothDirections();
  TestAddVertexIsIdempotentAndKeepsEdges();
  TestWouldCreateCycle();
  TestEnumerateCyclesReportsLoopsOnly();
  TestRebuildIsDeterministic();

  std::cout << "ragctx_unit_link_graph: pass\n";
  return 0;
}
