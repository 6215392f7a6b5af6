#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/graph/graph.hpp"

namespace graphflow::graph {

/*
  Name -> graph table owned by the runner.

  Graphs are validated on Register and immutable afterwards; lookups hand
  out shared ownership so a running traversal keeps its graph alive even
  if the name is re-registered meanwhile.
*/
class GraphRegistry {
 public:
  // Returns true when an existing graph with the same name was replaced.
  bool Register(std::shared_ptr<const Graph> graph);

  std::shared_ptr<const Graph> Find(const std::string& name) const;
  std::shared_ptr<const Graph> Get(const std::string& name) const;

  std::vector<std::string> List() const;
  std::size_t              Size() const;

 private:
  mutable std::shared_mutex                          mutex_;
  std::map<std::string, std::shared_ptr<const Graph>> graphs_;
};

} // namespace graphflow::graph
