#include "internal/graph/link_graph.hpp"

#include <algorithm>
#include <deque>
#include <mutex>
#include <unordered_set>

#include "internal/observability/logging.hpp"

namespace ragctx::graph {

void LinkGraph::EnsureVertexLocked(const std::string& path) {
  out_.try_emplace(path);
  in_.try_emplace(path);
}

void LinkGraph::AddVertex(const std::string& path) {
  std::unique_lock lock(mutex_);
  EnsureVertexLocked(path);
}

bool LinkGraph::RemoveVertex(const std::string& path) {
  std::unique_lock lock(mutex_);

  auto out_it = out_.find(path);
  if (out_it == out_.end()) {
    return false;
  }

  for (const auto& target : out_it->second) {
    if (target != path) in_[target].erase(path);
  }
  edge_count_ -= out_it->second.size();

  auto in_it = in_.find(path);
  for (const auto& source : in_it->second) {
    if (source == path) continue; // self-loop, already counted above
    out_[source].erase(path);
    --edge_count_;
  }

  out_.erase(out_it);
  in_.erase(in_it);
  return true;
}

bool LinkGraph::ReachesLocked(const std::string& from, const std::string& to) const {
  std::deque<std::string>         queue{from};
  std::unordered_set<std::string> visited{from};

  while (!queue.empty()) {
    auto current = std::move(queue.front());
    queue.pop_front();
    if (current == to) {
      return true;
    }

    auto it = out_.find(current);
    if (it == out_.end()) continue;
    for (const auto& next : it->second) {
      if (visited.insert(next).second) queue.push_back(next);
    }
  }
  return false;
}

void LinkGraph::ReplaceOutgoingEdges(const std::string& path, const std::vector<std::string>& targets) {
  std::set<std::string> wanted(targets.begin(), targets.end());

  std::unique_lock lock(mutex_);
  EnsureVertexLocked(path);

  auto& current = out_[path];
  for (const auto& old_target : current) {
    in_[old_target].erase(path);
  }
  edge_count_ -= current.size();
  current.clear();

  for (const auto& target : wanted) {
    EnsureVertexLocked(target);
    // reported, never blocked: link cycles are legal document structure
    if (ReachesLocked(target, path)) {
      RAGCTX_LOG_WARN("document link creates a cycle",
                      {observability::StringField("source", path), observability::StringField("target", target)});
    }
  }

  for (const auto& target : wanted) {
    current.insert(target);
    in_[target].insert(path);
  }
  edge_count_ += current.size();
}

bool LinkGraph::WouldCreateCycle(const std::string& source, const std::string& target) const {
  if (source == target) {
    return true;
  }
  std::shared_lock lock(mutex_);
  return ReachesLocked(target, source);
}

std::vector<TraversalHit> LinkGraph::Traverse(const std::vector<std::string>& start_paths, std::uint32_t max_depth, std::uint32_t max_count,
                                              std::stop_token stop, const EmitFilter& emittable) const {
  std::vector<TraversalHit> hits;
  if (max_depth == 0 || max_count == 0) {
    return hits;
  }

  std::shared_lock lock(mutex_);

  std::unordered_set<std::string> visited;
  std::vector<std::string>        frontier;
  for (const auto& start : start_paths) {
    if (visited.insert(start).second) frontier.push_back(start);
  }

  for (std::uint32_t depth = 1; depth <= max_depth && !frontier.empty(); ++depth) {
    if (stop.stop_requested()) {
      RAGCTX_LOG_DEBUG("link traversal cancelled", {observability::IntField("completed_levels", depth - 1)});
      break;
    }

    std::vector<std::string> next;
    for (const auto& vertex : frontier) {
      auto it = out_.find(vertex);
      if (it == out_.end()) continue;

      for (const auto& target : it->second) {
        if (!visited.insert(target).second) continue;
        next.push_back(target);

        if (emittable && !emittable(target)) continue;
        hits.push_back(TraversalHit{target, depth, vertex});
        if (hits.size() >= max_count) {
          return hits;
        }
      }
    }
    frontier = std::move(next);
  }

  return hits;
}

std::vector<std::string> LinkGraph::IncomingEdges(const std::string& path) const {
  std::shared_lock lock(mutex_);
  auto             it = in_.find(path);
  if (it == in_.end()) return {};
  return {it->second.begin(), it->second.end()};
}

std::vector<std::string> LinkGraph::OutgoingEdges(const std::string& path) const {
  std::shared_lock lock(mutex_);
  auto             it = out_.find(path);
  if (it == out_.end()) return {};
  return {it->second.begin(), it->second.end()};
}

std::vector<std::vector<std::string>> LinkGraph::EnumerateCycles() const {
  std::shared_lock lock(mutex_);

  std::vector<std::string> order;
  order.reserve(out_.size());
  for (const auto& [vertex, _] : out_) order.push_back(vertex);
  std::sort(order.begin(), order.end());

  struct NodeState {
    std::uint32_t index    = 0;
    std::uint32_t lowlink  = 0;
    bool          on_stack = false;
  };
  struct Frame {
    const std::string*                    vertex;
    std::set<std::string>::const_iterator next;
    std::set<std::string>::const_iterator end;
  };

  std::unordered_map<std::string, NodeState> state;
  std::vector<std::string>                   scc_stack;
  std::vector<Frame>                         frames;
  std::uint32_t                              next_index = 0;
  std::vector<std::vector<std::string>>      cycles;

  auto visit = [&](const std::string& vertex) {
    auto& node    = state[vertex];
    node.index    = next_index;
    node.lowlink  = next_index;
    node.on_stack = true;
    ++next_index;
    scc_stack.push_back(vertex);
    const auto& edges = out_.at(vertex);
    frames.push_back(Frame{&vertex, edges.begin(), edges.end()});
  };

  // Tarjan, with an explicit frame stack in place of recursion
  for (const auto& root : order) {
    if (state.contains(root)) continue;
    visit(out_.find(root)->first);

    while (!frames.empty()) {
      auto& frame = frames.back();
      if (frame.next != frame.end) {
        const std::string& target = *frame.next;
        ++frame.next;

        auto found = state.find(target);
        if (found == state.end()) {
          // keys of out_ outlive this call, so the frame may point into it
          visit(out_.find(target)->first);
        } else if (found->second.on_stack) {
          auto& node   = state[*frame.vertex];
          node.lowlink = std::min(node.lowlink, found->second.index);
        }
        continue;
      }

      const std::string& vertex = *frame.vertex;
      frames.pop_back();
      auto& node = state[vertex];

      if (node.lowlink == node.index) {
        std::vector<std::string> component;
        std::string              member;
        do {
          member = scc_stack.back();
          scc_stack.pop_back();
          state[member].on_stack = false;
          component.push_back(member);
        } while (member != vertex);

        const bool self_loop = component.size() == 1 && out_.at(vertex).contains(vertex);
        if (component.size() > 1 || self_loop) {
          std::sort(component.begin(), component.end());
          cycles.push_back(std::move(component));
        }
      }

      if (!frames.empty()) {
        auto& parent   = state[*frames.back().vertex];
        parent.lowlink = std::min(parent.lowlink, node.lowlink);
      }
    }
  }

  std::sort(cycles.begin(), cycles.end());
  return cycles;
}

bool LinkGraph::HasVertex(const std::string& path) const {
  std::shared_lock lock(mutex_);
  return out_.contains(path);
}

std::size_t LinkGraph::VertexCount() const {
  std::shared_lock lock(mutex_);
  return out_.size();
}

std::size_t LinkGraph::EdgeCount() const {
  std::shared_lock lock(mutex_);
  return edge_count_;
}

void LinkGraph::Rebuild(const std::vector<DocumentLinks>& documents) {
  Adjacency   out;
  Adjacency   in;
  std::size_t edges = 0;

  for (const auto& doc : documents) {
    out.try_emplace(doc.path);
    in.try_emplace(doc.path);
    for (const auto& target : doc.outgoing_links) {
      out.try_emplace(target);
      in.try_emplace(target);
      if (out[doc.path].insert(target).second) {
        in[target].insert(doc.path);
        ++edges;
      }
    }
  }

  std::unique_lock lock(mutex_);
  out_        = std::move(out);
  in_         = std::move(in);
  edge_count_ = edges;
}

GraphSnapshot LinkGraph::Snapshot() const {
  GraphSnapshot snapshot;

  std::shared_lock lock(mutex_);
  snapshot.vertices.reserve(out_.size());
  snapshot.edges.reserve(edge_count_);
  for (const auto& [source, targets] : out_) {
    snapshot.vertices.push_back(source);
    for (const auto& target : targets) snapshot.edges.emplace_back(source, target);
  }
  lock.unlock();

  std::sort(snapshot.vertices.begin(), snapshot.vertices.end());
  std::sort(snapshot.edges.begin(), snapshot.edges.end());
  return snapshot;
}

} // namespace ragctx::graph
