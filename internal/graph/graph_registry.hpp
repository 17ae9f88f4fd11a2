#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/graph/link_graph.hpp"

namespace ragctx::graph {

/*
  GraphRegistry

  One LinkGraph per tenant. Paths are unique only inside a tenant, so two
  tenants never share vertices and a rebuild of one leaves the others alone.

  The registry lock only guards the map; each graph keeps its own
  reader/writer lock.
*/
class GraphRegistry {
 public:
  // Created empty on first use.
  std::shared_ptr<LinkGraph> For(const std::string& tenant_key);

  // Null when nothing was indexed for the tenant.
  std::shared_ptr<LinkGraph> Find(const std::string& tenant_key) const;

  // Sorted.
  std::vector<std::string> TenantKeys() const;

  // Totals over every tenant.
  std::size_t VertexCount() const;
  std::size_t EdgeCount() const;

 private:
  mutable std::mutex                                mutex_;
  std::map<std::string, std::shared_ptr<LinkGraph>> graphs_;
};

} // namespace ragctx::graph
