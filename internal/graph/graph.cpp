#include "internal/graph/graph.hpp"

#include "internal/util/errors.hpp"

namespace graphflow::graph {

using namespace graphflow::v1;

Graph::Graph(std::string name, std::string description) : name_(std::move(name)), description_(std::move(description)) {
}

Graph& Graph::AddNode(std::string name, ComputeFn fn, std::string output_type, std::string description) {
  if (name.empty()) {
    throw util::InvalidArgument("graph '" + name_ + "': node name must not be empty");
  }
  if (nodes_.count(name) || routers_.count(name)) {
    throw util::InvalidArgument("graph '" + name_ + "': duplicate node '" + name + "'");
  }

  ComputeNode node;
  node.name        = name;
  node.description = std::move(description);
  node.output_type = std::move(output_type);
  node.fn          = std::move(fn);
  nodes_.emplace(std::move(name), std::move(node));
  return *this;
}

Graph& Graph::AddRouter(std::string name, RouterFn fn, std::vector<std::string> targets, std::string description) {
  if (name.empty()) {
    throw util::InvalidArgument("graph '" + name_ + "': router name must not be empty");
  }
  if (nodes_.count(name) || routers_.count(name)) {
    throw util::InvalidArgument("graph '" + name_ + "': duplicate node '" + name + "'");
  }

  RouterNode router;
  router.name        = name;
  router.description = std::move(description);
  router.targets     = std::move(targets);
  router.fn          = std::move(fn);
  routers_.emplace(std::move(name), std::move(router));
  return *this;
}

Graph& Graph::AddEdge(const std::string& from, const std::string& to) {
  edges_[from].push_back(to);
  return *this;
}

Graph& Graph::SetStartNode(std::string name) {
  start_node_ = std::move(name);
  return *this;
}

void Graph::Validate() const {
  if (name_.empty()) {
    throw util::InvalidArgument("graph name must not be empty");
  }
  if (start_node_.empty()) {
    throw util::InvalidArgument("graph '" + name_ + "': start node is not set");
  }
  if (!IsNode(start_node_)) {
    throw util::UnknownNodeError("graph '" + name_ + "': start node '" + start_node_ + "' is not a compute node");
  }

  for (const auto& [name, node] : nodes_) {
    if (!node.fn) {
      throw util::InvalidArgument("graph '" + name_ + "': node '" + name + "' has no function");
    }
  }

  for (const auto& [name, router] : routers_) {
    if (!router.fn) {
      throw util::InvalidArgument("graph '" + name_ + "': router '" + name + "' has no function");
    }
    for (const auto& target : router.targets) {
      if (!IsNode(target)) {
        throw util::UnknownNodeError("graph '" + name_ + "': router '" + name + "' declares unknown target '" + target + "'");
      }
    }
  }

  for (const auto& [from, targets] : edges_) {
    // Routers are never enqueued, so their edges would never be followed.
    if (IsRouter(from)) {
      throw util::InvalidArgument("graph '" + name_ + "': edge from router '" + from + "', routers only choose successors");
    }
    if (!IsNode(from)) {
      throw util::UnknownNodeError("graph '" + name_ + "': edge from unknown node '" + from + "'");
    }
    for (const auto& to : targets) {
      if (!IsNode(to) && !IsRouter(to)) {
        throw util::UnknownNodeError("graph '" + name_ + "': edge " + from + " -> " + to + " names an unknown node");
      }
    }
  }
}

GraphDescription Graph::Describe() const {
  GraphDescription description;
  description.set_name(name_);
  description.set_description(description_);
  description.set_start_node(start_node_);

  for (const auto& [name, node] : nodes_) {
    auto* out = description.add_nodes();
    out->set_name(name);
    out->set_kind(NODE_KIND_COMPUTE);
    out->set_description(node.description);
    out->set_output_type(node.output_type);
  }

  for (const auto& [name, router] : routers_) {
    auto* out = description.add_nodes();
    out->set_name(name);
    out->set_kind(NODE_KIND_ROUTER);
    out->set_description(router.description);
    for (const auto& target : router.targets) {
      out->add_router_targets(target);
    }
  }

  for (const auto& [from, targets] : edges_) {
    auto& list = (*description.mutable_edges())[from];
    for (const auto& to : targets) {
      list.add_targets(to);
    }
  }

  return description;
}

bool Graph::IsNode(const std::string& name) const {
  return nodes_.count(name) > 0;
}

bool Graph::IsRouter(const std::string& name) const {
  return routers_.count(name) > 0;
}

const ComputeNode* Graph::FindNode(const std::string& name) const {
  auto it = nodes_.find(name);
  return it == nodes_.end() ? nullptr : &it->second;
}

const RouterNode* Graph::FindRouter(const std::string& name) const {
  auto it = routers_.find(name);
  return it == routers_.end() ? nullptr : &it->second;
}

const std::vector<std::string>& Graph::Successors(const std::string& name) const {
  static const std::vector<std::string> kNone;
  auto it = edges_.find(name);
  return it == edges_.end() ? kNone : it->second;
}

std::vector<Record> Graph::Invoke(const std::string& node, const Record& input) const {
  const auto* compute = FindNode(node);
  if (!compute) {
    throw util::UnknownNodeError("graph '" + name_ + "': unknown node '" + node + "'");
  }
  return compute->fn(input);
}

RouterOutput Graph::InvokeRouter(const std::string& router, const Record& input) const {
  const auto* route = FindRouter(router);
  if (!route) {
    throw util::UnknownNodeError("graph '" + name_ + "': unknown router '" + router + "'");
  }
  return route->fn(input);
}

} // namespace graphflow::graph
