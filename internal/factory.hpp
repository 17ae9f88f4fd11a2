#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/assembly/context_assembler.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/graph/graph_registry.hpp"
#include "internal/retrieval/relevance_retriever.hpp"
#include "internal/service/context_service.hpp"
#include "internal/service/index_service.hpp"
#include "internal/supersession/supersession_tracker.hpp"
#include "internal/vector/memory_vector_store.hpp"

namespace ragctx::factory {

/*
  Runtime

  Owns every long-lived component of one ragctx instance.
*/
struct Runtime {
  std::shared_ptr<db::Repository>                   repository;
  std::shared_ptr<vector::MemoryVectorStore>        vector_store;
  std::shared_ptr<graph::GraphRegistry>             graphs;
  std::shared_ptr<supersession::SupersessionTracker> tracker;
  std::shared_ptr<retrieval::RelevanceRetriever>    retriever;
  std::shared_ptr<assembly::ContextAssembler>       assembler;

  std::shared_ptr<service::ContextService> context_service;
  std::shared_ptr<service::IndexService>   index_service;
};

/*
  Build

  Constructs the entire backend from runtime config. The composition root:
  the only place that knows concrete repository types.
*/
Runtime Build(const ragctx::runtime::config::RuntimeConfig& config);

} // namespace ragctx::factory
