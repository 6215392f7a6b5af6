#pragma once

#include <memory>

#include "config/config.pb.h"

namespace graphflow::cache { class ContentCache; }
namespace graphflow::core { class GraphRunner; }
namespace graphflow::service { class GraphService; }

namespace graphflow::factory {

/*
  Application

  Owns all long-lived components used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<cache::ContentCache> cache;
  std::shared_ptr<core::GraphRunner>   runner;

  std::shared_ptr<service::GraphService> graph_service;
};

/*
  BuildCache

  Content cache backend selected by config.cache. Durable backends get
  their schema bootstrapped here.
*/
std::shared_ptr<cache::ContentCache> BuildCache(const graphflow::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root of the application: cache, runner with the built-in
  graphs registered, services. It is the ONLY place allowed to know
  concrete cache types.
*/
Application Build(const graphflow::runtime::config::RuntimeConfig& config);

}
