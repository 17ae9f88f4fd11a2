#include "factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if RAGCTX_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace ragctx::factory {

namespace {

std::shared_ptr<db::Repository> BuildRepository(const ragctx::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RAGCTX_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    sqlite_db->BootstrapSchema();
    RAGCTX_LOG_INFO("sqlite repository opened", {observability::StringField("path", sqlite_db->Path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

retrieval::BoostConfig BuildBoosts(const ragctx::runtime::config::ScoringConfig& scoring) {
  retrieval::BoostConfig boosts;
  boosts.critical  = scoring.critical_boost();
  boosts.important = scoring.important_boost();
  boosts.standard  = scoring.standard_boost();
  return boosts;
}

} // namespace

Runtime Build(const ragctx::runtime::config::RuntimeConfig& config) {
  Runtime rt;

  // ------------------------------------------------------------------
  // Stores
  // ------------------------------------------------------------------
  rt.repository   = BuildRepository(config);
  rt.vector_store = std::make_shared<vector::MemoryVectorStore>();
  rt.graphs       = std::make_shared<graph::GraphRegistry>();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  supersession::TrackerConfig tracker_config;
  tracker_config.max_chain_depth = config.supersession().max_chain_depth();
  tracker_config.decay           = config.supersession().decay();
  rt.tracker = std::make_shared<supersession::SupersessionTracker>(rt.repository, tracker_config);

  rt.retriever = std::make_shared<retrieval::RelevanceRetriever>(rt.vector_store, BuildBoosts(config.scoring()),
                                                                 config.retrieval().overfetch_factor());
  rt.assembler = std::make_shared<assembly::ContextAssembler>(rt.repository, rt.retriever, rt.graphs, rt.tracker);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository         = rt.repository;
  ctx.graphs             = rt.graphs;
  ctx.tracker            = rt.tracker;
  ctx.assembler          = rt.assembler;
  ctx.retrieval_defaults = config.retrieval();

  rt.context_service = std::make_shared<service::ContextService>(ctx);
  rt.index_service   = std::make_shared<service::IndexService>(ctx);

  return rt;
}

} // namespace ragctx::factory
