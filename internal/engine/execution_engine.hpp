#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "graphflow/v1.hpp"

namespace graphflow::cache {
class ContentCache;
}
namespace graphflow::graph {
class Graph;
}
namespace graphflow::invocation {
class Invocation;
}

namespace graphflow::engine {

struct EngineOptions {
  // Upper bound on dequeued work items per traversal. Routers may form
  // cycles; exceeding the bound throws StepBudgetExceeded.
  std::uint64_t max_work_items = 100000;
};

struct WorkItem {
  std::string           node;
  graphflow::v1::Record input;
};

/*
  ExecutionEngine

  Drives one traversal: a FIFO of (node, record) work items seeded with the
  start node and the initial record.

  Per work item:
    1. look up (graph, node, CacheKey(input)) in the content cache
    2. on a miss invoke the node and store the encoded outputs
    3. append the outputs to the invocation
    4. resolve successors (static edges, then router-discovered edges)
    5. enqueue every successor with every output, successor-major

  Any exception from a node, router, cache or codec aborts the traversal
  unchanged. Outputs appended before the failure stay in the invocation.
*/
class ExecutionEngine {
 public:
  explicit ExecutionEngine(std::shared_ptr<cache::ContentCache> cache, EngineOptions options = {});

  void Run(const graph::Graph& graph, const graphflow::v1::Record& input, invocation::Invocation& invocation) const;

  const EngineOptions& Options() const {
    return options_;
  }

 private:
  std::vector<graphflow::v1::Record> Evaluate(const graph::Graph& graph, const WorkItem& item, invocation::Invocation& invocation) const;

  std::vector<std::string> ResolveSuccessors(const graph::Graph& graph, const std::string& node, const std::vector<graphflow::v1::Record>& outputs,
                                             invocation::Invocation& invocation) const;

  std::shared_ptr<cache::ContentCache> cache_;
  EngineOptions                        options_;
};

} // namespace graphflow::engine
