#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "graphflow/v1.hpp"

namespace graphflow::graph {

using ComputeFn = std::function<std::vector<graphflow::v1::Record>(const graphflow::v1::Record&)>;
using RouterFn  = std::function<graphflow::v1::RouterOutput(const graphflow::v1::Record&)>;

struct ComputeNode {
  std::string name;
  std::string description;
  // Fully qualified protobuf message name of the node's outputs, may be empty.
  std::string output_type;
  ComputeFn   fn;
};

struct RouterNode {
  std::string              name;
  std::string              description;
  std::vector<std::string> targets;
  RouterFn                 fn;
};

/*
  Graph

  Static description of one dataflow graph: compute nodes, routers, the
  ordered successor list of every node and the start node.

  Lifecycle:
    built with the Add* calls, validated by Validate() (the registry does
    this on Register), then shared read-only between traversals.

  Edges may point at a compute node or at a router. A router is never
  enqueued itself; it is consulted once per output of its predecessor and
  the names it returns become extra successors of that predecessor.
*/
class Graph {
 public:
  explicit Graph(std::string name, std::string description = {});

  Graph& AddNode(std::string name, ComputeFn fn, std::string output_type = {}, std::string description = {});
  Graph& AddRouter(std::string name, RouterFn fn, std::vector<std::string> targets = {}, std::string description = {});
  Graph& AddEdge(const std::string& from, const std::string& to);
  Graph& SetStartNode(std::string name);

  // Throws InvalidArgument for structural problems (empty names, missing
  // functions, edges out of a router) and UnknownNodeError for dangling
  // references.
  void Validate() const;

  graphflow::v1::GraphDescription Describe() const;

  const std::string& Name() const {
    return name_;
  }
  const std::string& Description() const {
    return description_;
  }
  const std::string& StartNode() const {
    return start_node_;
  }

  bool IsNode(const std::string& name) const;
  bool IsRouter(const std::string& name) const;

  const ComputeNode* FindNode(const std::string& name) const;
  const RouterNode*  FindRouter(const std::string& name) const;

  const std::vector<std::string>& Successors(const std::string& name) const;

  const std::map<std::string, ComputeNode>& Nodes() const {
    return nodes_;
  }
  const std::map<std::string, RouterNode>& Routers() const {
    return routers_;
  }

  std::vector<graphflow::v1::Record> Invoke(const std::string& node, const graphflow::v1::Record& input) const;
  graphflow::v1::RouterOutput        InvokeRouter(const std::string& router, const graphflow::v1::Record& input) const;

 private:
  std::string name_;
  std::string description_;
  std::string start_node_;

  std::map<std::string, ComputeNode>              nodes_;
  std::map<std::string, RouterNode>               routers_;
  std::map<std::string, std::vector<std::string>> edges_;
};

} // namespace graphflow::graph
