#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "graphflow/examples/v1/text.pb.h"
#include "internal/cache/content_cache.hpp"
#include "internal/cache/memory_content_cache.hpp"
#include "internal/core/graph_runner.hpp"
#include "internal/graphs/text_pipeline.hpp"

#if GRAPHFLOW_CACHE_SQLITE
#include "internal/cache/sqlite_content_cache.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#endif

#if GRAPHFLOW_CACHE_POSTGRES
#include "internal/cache/pg_content_cache.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#endif

namespace {

using graphflow::cache::ContentCache;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                         name;
  std::function<std::shared_ptr<ContentCache>()>      make_cache;
  std::function<bool()>                               supports_restart;
  std::function<void(std::shared_ptr<ContentCache>&)> restart;
  std::function<void()>                               cleanup;
};

void VerifyMissThenHit(ContentCache& cache, const std::string& graph) {
  assert(!cache.Get(graph, "node", "input").has_value());

  const std::vector<std::string> outputs{"first", std::string("sec\0ond", 7)};
  cache.Put(graph, "node", "input", outputs);

  const auto hit = cache.Get(graph, "node", "input");
  assert(hit.has_value());
  assert(*hit == outputs);
}

// Keys and values holding every byte value, NUL and high bytes included.
void VerifyArbitraryBytesRoundTrip(ContentCache& cache, const std::string& graph) {
  std::string all_bytes;
  for (int b = 0; b < 256; ++b) {
    all_bytes.push_back(static_cast<char>(b));
  }
  const std::string reversed(all_bytes.rbegin(), all_bytes.rend());

  cache.Put(graph, "node", all_bytes, {reversed, all_bytes});
  const auto hit = cache.Get(graph, "node", all_bytes);
  assert(hit.has_value());
  assert(hit->size() == 2);
  assert((*hit)[0] == reversed);
  assert((*hit)[1] == all_bytes);

  // A key cut at its leading NUL is a different entry.
  assert(!cache.Get(graph, "node", std::string("\0", 1)).has_value());
  assert(!cache.Get(graph, "node", reversed).has_value());
}

void VerifyEmptyOutputsAreCached(ContentCache& cache, const std::string& graph) {
  cache.Put(graph, "sink", "input", {});

  const auto hit = cache.Get(graph, "sink", "input");
  assert(hit.has_value());
  assert(hit->empty());
}

void VerifyKeysAreIsolated(ContentCache& cache, const std::string& graph) {
  cache.Put(graph, "a", "x", {"ax"});
  cache.Put(graph, "b", "x", {"bx"});
  cache.Put(graph + "-other", "a", "x", {"other"});

  assert(cache.Get(graph, "a", "x")->front() == "ax");
  assert(cache.Get(graph, "b", "x")->front() == "bx");
  assert(cache.Get(graph + "-other", "a", "x")->front() == "other");
  assert(!cache.Get(graph, "a", "y").has_value());
}

void VerifyOverwriteReplacesWholeEntry(ContentCache& cache, const std::string& graph) {
  cache.Put(graph, "node", "key", {"one", "two", "three"});
  cache.Put(graph, "node", "key", {"four"});

  const auto hit = cache.Get(graph, "node", "key");
  assert(hit.has_value());
  assert(hit->size() == 1);
  assert(hit->front() == "four");
}

void VerifyConcurrentAccess(ContentCache& cache, const std::string& graph) {
  std::vector<std::thread> workers;
  for (int t = 0; t < 4; ++t) {
    workers.emplace_back([&cache, &graph, t] {
      for (int i = 0; i < 25; ++i) {
        const auto key = std::to_string(t) + "-" + std::to_string(i);
        cache.Put(graph, "concurrent", key, {key});
        const auto hit = cache.Get(graph, "concurrent", key);
        assert(hit.has_value());
        assert(hit->front() == key);
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
}

void VerifyPipelineOutputsMatchUncachedRun(std::shared_ptr<ContentCache> cache) {
  graphflow::core::GraphRunner cached(std::move(cache));
  graphflow::core::GraphRunner uncached(std::make_shared<graphflow::cache::DisabledContentCache>());
  cached.Register(graphflow::graphs::BuildTextPipeline());
  uncached.Register(graphflow::graphs::BuildTextPipeline());

  google::protobuf::Struct input;
  (*input.mutable_fields())["text"].set_string_value("Caches never change answers. They only save work.");

  // Second cached run is served from the cache.
  cached.Submit(graphflow::graphs::kTextPipeline, input);
  const auto cached_id   = cached.Submit(graphflow::graphs::kTextPipeline, input);
  const auto uncached_id = uncached.Submit(graphflow::graphs::kTextPipeline, input);

  for (const auto* node : {"extract_text", "split_sentences", "count_words", "summarize_short"}) {
    const auto lhs = cached.Query(cached_id, node);
    const auto rhs = uncached.Query(uncached_id, node);
    assert(lhs.size() == rhs.size());
    for (std::size_t i = 0; i < lhs.size(); ++i) {
      assert(lhs[i].payload() == rhs[i].payload());
    }
  }
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& graph) {
  if (!backend.supports_restart()) {
    return;
  }

  auto cache = backend.make_cache();
  cache->Put(graph, "durable", "input", {"kept"});

  backend.restart(cache);

  const auto hit = cache->Get(graph, "durable", "input");
  assert(hit.has_value());
  assert(hit->front() == "kept");
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_cache       = []() { return std::make_shared<graphflow::cache::MemoryContentCache>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<ContentCache>&) {},
      .cleanup          = []() {},
  };
}

#if GRAPHFLOW_CACHE_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("graphflow_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_cache = [db_path]() -> std::shared_ptr<ContentCache> {
    auto db = std::make_shared<graphflow::db::sqlite::SqliteDB>(db_path);
    graphflow::cache::SqliteContentCache::Bootstrap(*db);
    return std::make_shared<graphflow::cache::SqliteContentCache>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_cache       = make_cache,
      .supports_restart = []() { return true; },
      .restart          = [make_cache](std::shared_ptr<ContentCache>& cache) { cache = make_cache(); },
      .cleanup          = [db_path]() { std::filesystem::remove(db_path); },
  };
}
#endif

#if GRAPHFLOW_CACHE_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("GRAPHFLOW_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("GRAPHFLOW_TEST_POSTGRES_URI is not set");
  }

  auto conninfo   = std::string(uri);
  auto make_cache = [conninfo]() -> std::shared_ptr<ContentCache> {
    auto pool = std::make_shared<graphflow::db::postgres::PgPool>(conninfo);
    graphflow::cache::PgContentCache::Bootstrap(*pool);
    return std::make_shared<graphflow::cache::PgContentCache>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_cache       = make_cache,
      .supports_restart = []() { return true; },
      .restart          = [make_cache](std::shared_ptr<ContentCache>& cache) { cache = make_cache(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto cache = backend.make_cache();

  // Unique per run so a persistent postgres database starts empty.
  const auto graph = backend.name + "-" + std::to_string(NowMs());

  VerifyMissThenHit(*cache, graph + "-hit");
  VerifyArbitraryBytesRoundTrip(*cache, graph + "-bytes");
  VerifyEmptyOutputsAreCached(*cache, graph + "-empty");
  VerifyKeysAreIsolated(*cache, graph + "-isolated");
  VerifyOverwriteReplacesWholeEntry(*cache, graph + "-overwrite");
  VerifyConcurrentAccess(*cache, graph + "-concurrent");
  VerifyPipelineOutputsMatchUncachedRun(cache);

  VerifyRestartDurability(backend, graph + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if GRAPHFLOW_CACHE_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if GRAPHFLOW_CACHE_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "graphflow_integration_cache_parity: pass\n";
  return 0;
}
