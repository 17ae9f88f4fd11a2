#pragma once

#include <memory>

#include "config/config.pb.h"

namespace ragctx::db { class Repository; }
namespace ragctx::graph { class GraphRegistry; }
namespace ragctx::supersession { class SupersessionTracker; }
namespace ragctx::assembly { class ContextAssembler; }

namespace ragctx::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<ragctx::db::Repository>                   repository;
  std::shared_ptr<ragctx::graph::GraphRegistry>             graphs;
  std::shared_ptr<ragctx::supersession::SupersessionTracker> tracker;
  std::shared_ptr<ragctx::assembly::ContextAssembler>       assembler;

  // defaults for any option a request leaves unset
  ragctx::runtime::config::RetrievalConfig retrieval_defaults;
};

} // namespace ragctx::service
