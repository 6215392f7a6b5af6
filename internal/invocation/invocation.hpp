#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "graphflow/v1.hpp"
#include "internal/util/time.hpp"

namespace graphflow::graph {
class Graph;
}

namespace graphflow::invocation {

/*
  Invocation

  Outputs accumulator and bookkeeping of one submitted input.

  The accumulator maps node -> ordered outputs and is only ever appended
  to. A node that ran but produced nothing still counts as visited.

  The graph definition the traversal ran on is pinned for the lifetime of
  the invocation, so re-registering the name does not retype old outputs.

  Locking:
    slots_mutex_  guards the node table itself
    Slot::mutex   guards one node's outputs and statistics
    state_mutex_  guards state, error and timestamps
*/
class Invocation {
 public:
  Invocation(std::string id, std::string graph, std::shared_ptr<const graph::Graph> definition = nullptr);

  const std::string& Id() const {
    return id_;
  }
  const std::string& Graph() const {
    return graph_;
  }
  const std::shared_ptr<const graph::Graph>& Definition() const {
    return definition_;
  }

  // outputs

  void                                              Append(const std::string& node, const std::vector<graphflow::v1::Record>& outputs);
  std::optional<std::vector<graphflow::v1::Record>> Outputs(const std::string& node) const;
  std::vector<std::string>                          VisitedNodes() const;

  // statistics

  void RecordWorkItem(const std::string& node, bool cache_hit);
  void RecordRouterCall(const std::string& router, std::uint64_t dropped_edges);
  void RecordFailure(const std::string& node);

  // lifecycle

  void MarkCompleted();
  void MarkFailed(const std::string& error);

  graphflow::v1::InvocationState   State() const;
  graphflow::v1::InvocationSummary Summary() const;

 private:
  struct Slot {
    mutable std::mutex                 mutex;
    bool                               visited = false;
    std::vector<graphflow::v1::Record> outputs;
    graphflow::v1::NodeStats           stats;
  };

  Slot& SlotFor(const std::string& node);

  const std::string id_;
  const std::string graph_;

  const std::shared_ptr<const graph::Graph> definition_;

  mutable std::shared_mutex                    slots_mutex_;
  std::map<std::string, std::unique_ptr<Slot>> slots_;

  mutable std::mutex             state_mutex_;
  graphflow::v1::InvocationState state_ = graphflow::v1::INVOCATION_STATE_RUNNING;
  std::string                    error_;
  util::TimePoint                created_at_;
  std::optional<util::TimePoint> finished_at_;
};

} // namespace graphflow::invocation
