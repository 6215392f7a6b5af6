#include "internal/graph/graph_registry.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace graphflow::graph {

bool GraphRegistry::Register(std::shared_ptr<const Graph> graph) {
  if (!graph) {
    throw util::InvalidArgument("cannot register a null graph");
  }
  graph->Validate();

  std::unique_lock lock(mutex_);
  const auto name = graph->Name();
  return !graphs_.insert_or_assign(name, std::move(graph)).second;
}

std::shared_ptr<const Graph> GraphRegistry::Find(const std::string& name) const {
  std::shared_lock lock(mutex_);
  auto             it = graphs_.find(name);
  return it == graphs_.end() ? nullptr : it->second;
}

std::shared_ptr<const Graph> GraphRegistry::Get(const std::string& name) const {
  auto graph = Find(name);
  if (!graph) {
    throw util::NotFound("graph not found: " + name);
  }
  return graph;
}

std::vector<std::string> GraphRegistry::List() const {
  std::shared_lock         lock(mutex_);
  std::vector<std::string> names;
  names.reserve(graphs_.size());
  for (const auto& [name, graph] : graphs_) {
    names.push_back(name);
  }
  return names;
}

std::size_t GraphRegistry::Size() const {
  std::shared_lock lock(mutex_);
  return graphs_.size();
}

} // namespace graphflow::graph
