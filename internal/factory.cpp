#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/cache/content_cache.hpp"
#include "internal/cache/memory_content_cache.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/core/graph_runner.hpp"
#include "internal/graphs/text_pipeline.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/graph_service.hpp"
#include "internal/service/service_context.hpp"
#if GRAPHFLOW_CACHE_SQLITE
#include "internal/cache/sqlite_content_cache.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#endif
#if GRAPHFLOW_CACHE_POSTGRES
#include "internal/cache/pg_content_cache.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#endif

namespace graphflow::factory {

using graphflow::observability::StringField;

std::shared_ptr<cache::ContentCache> BuildCache(const graphflow::runtime::config::RuntimeConfig& config) {
  const auto& cache_config = config.cache();

  if (cache_config.has_sqlite()) {
#if GRAPHFLOW_CACHE_SQLITE
    const auto& sqlite = cache_config.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("sqlite cache requires a path");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode());
    cache::SqliteContentCache::Bootstrap(*sqlite_db);
    return std::make_shared<cache::SqliteContentCache>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite cache requested but not enabled at build time");
#endif
  }

  if (cache_config.has_postgres()) {
#if GRAPHFLOW_CACHE_POSTGRES
    const auto& postgres = cache_config.postgres();
    auto        pool     = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), postgres.max_connections() > 0 ? postgres.max_connections() : 16);
    cache::PgContentCache::Bootstrap(*pool);
    return std::make_shared<cache::PgContentCache>(std::move(pool));
#else
    throw std::runtime_error("postgres cache requested but not enabled at build time");
#endif
  }

  if (cache_config.has_disabled()) {
    return std::make_shared<cache::DisabledContentCache>();
  }

  return std::make_shared<cache::MemoryContentCache>();
}

/*
    Build full application dependency graph
*/
Application Build(const graphflow::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Cache and engine
  // ------------------------------------------------------------------
  app.cache = BuildCache(config);

  engine::EngineOptions options;
  options.max_work_items = config.engine().max_work_items() > 0 ? config.engine().max_work_items() : config::kDefaultMaxWorkItems;

  app.runner = std::make_shared<core::GraphRunner>(app.cache, options);

  // ------------------------------------------------------------------
  // Built-in graphs
  // ------------------------------------------------------------------
  app.runner->Register(graphs::BuildTextPipeline());

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.runner = app.runner;

  app.graph_service = std::make_shared<service::GraphService>(ctx);

  GRAPHFLOW_LOG_INFO("application built", {StringField("cache", app.cache->Name())});
  return app;
}

}
