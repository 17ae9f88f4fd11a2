#include "internal/graph/graph_registry.hpp"

namespace ragctx::graph {

std::shared_ptr<LinkGraph> GraphRegistry::For(const std::string& tenant_key) {
  std::lock_guard lock(mutex_);
  auto&           graph = graphs_[tenant_key];
  if (!graph) {
    graph = std::make_shared<LinkGraph>();
  }
  return graph;
}

std::shared_ptr<LinkGraph> GraphRegistry::Find(const std::string& tenant_key) const {
  std::lock_guard lock(mutex_);
  auto            it = graphs_.find(tenant_key);
  return it == graphs_.end() ? nullptr : it->second;
}

std::vector<std::string> GraphRegistry::TenantKeys() const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> keys;
  keys.reserve(graphs_.size());
  for (const auto& [key, _] : graphs_) keys.push_back(key);
  return keys;
}

std::size_t GraphRegistry::VertexCount() const {
  std::lock_guard lock(mutex_);
  std::size_t     total = 0;
  for (const auto& [_, graph] : graphs_) total += graph->VertexCount();
  return total;
}

std::size_t GraphRegistry::EdgeCount() const {
  std::lock_guard lock(mutex_);
  std::size_t     total = 0;
  for (const auto& [_, graph] : graphs_) total += graph->EdgeCount();
  return total;
}

} // namespace ragctx::graph
