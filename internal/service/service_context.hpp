#pragma once

#include <memory>

namespace graphflow::core { class GraphRunner; }

namespace graphflow::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<graphflow::core::GraphRunner> runner;
};

}
