#include "internal/graph/graph.hpp"
#include "internal/graph/graph_registry.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/util/errors.hpp"

namespace {

using graphflow::graph::Graph;
using graphflow::v1::Record;
using graphflow::v1::RouterOutput;

std::vector<Record> Echo(const Record& input) {
  return {input};
}

RouterOutput Nowhere(const Record&) {
  return {};
}

template <typename Error>
bool Throws(const Graph& graph) {
  try {
    graph.Validate();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestValidGraphPassesValidation() {
  Graph graph("valid");
  graph.AddNode("A", Echo).AddNode("B", Echo).AddRouter("R", Nowhere, {"B"}).AddEdge("A", "B").AddEdge("A", "R").SetStartNode("A");
  graph.Validate();

  assert(graph.IsNode("A"));
  assert(graph.IsRouter("R"));
  assert(!graph.IsNode("R"));
  assert((graph.Successors("A") == std::vector<std::string>{"B", "R"}));
  assert(graph.Successors("B").empty());
}

void TestStartNodeMustBeComputeNode() {
  Graph missing("missing_start");
  missing.AddNode("A", Echo);
  assert(Throws<graphflow::util::InvalidArgument>(missing));

  Graph unknown("unknown_start");
  unknown.AddNode("A", Echo).SetStartNode("Z");
  assert(Throws<graphflow::util::UnknownNodeError>(unknown));

  Graph router_start("router_start");
  router_start.AddNode("A", Echo).AddRouter("R", Nowhere).SetStartNode("R");
  assert(Throws<graphflow::util::UnknownNodeError>(router_start));
}

void TestDanglingEdgeIsRejected() {
  Graph graph("dangling");
  graph.AddNode("A", Echo).AddEdge("A", "ghost").SetStartNode("A");
  assert(Throws<graphflow::util::UnknownNodeError>(graph));
}

void TestRouterTargetsMustBeComputeNodes() {
  Graph graph("router_targets");
  graph.AddNode("A", Echo).AddRouter("R1", Nowhere).AddRouter("R2", Nowhere, {"R1"}).AddEdge("A", "R2").SetStartNode("A");
  assert(Throws<graphflow::util::UnknownNodeError>(graph));
}

void TestEdgeFromRouterIsRejected() {
  Graph graph("router_source");
  graph.AddNode("A", Echo).AddNode("B", Echo).AddRouter("R", Nowhere, {"B"}).AddEdge("A", "R").AddEdge("R", "B").SetStartNode("A");
  assert(Throws<graphflow::util::InvalidArgument>(graph));

  graphflow::graph::GraphRegistry registry;
  bool                            threw = false;
  try {
    registry.Register(std::make_shared<Graph>(graph));
  } catch (const graphflow::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw && "Registration validates router edges too.");
}

void TestDuplicateNamesAreRejected() {
  Graph graph("duplicates");
  graph.AddNode("A", Echo);

  bool threw = false;
  try {
    graph.AddRouter("A", Nowhere);
  } catch (const graphflow::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw && "A name cannot be both a node and a router.");
}

void TestDescribeListsNodesRoutersAndEdges() {
  Graph graph("described", "demo graph");
  graph.AddNode("A", Echo, "graphflow.core.v1.Record", "first").AddNode("B", Echo).AddRouter("R", Nowhere, {"B"}).AddEdge("A", "R").AddEdge("A", "B").SetStartNode("A");

  const auto description = graph.Describe();
  assert(description.name() == "described");
  assert(description.description() == "demo graph");
  assert(description.start_node() == "A");
  assert(description.nodes_size() == 3);

  int routers = 0;
  for (const auto& node : description.nodes()) {
    if (node.kind() == graphflow::v1::NODE_KIND_ROUTER) {
      ++routers;
      assert(node.name() == "R");
      assert(node.router_targets_size() == 1 && node.router_targets(0) == "B");
    }
    if (node.name() == "A") {
      assert(node.output_type() == "graphflow.core.v1.Record");
      assert(node.description() == "first");
    }
  }
  assert(routers == 1);

  const auto& edges = description.edges().at("A");
  assert(edges.targets_size() == 2);
  assert(edges.targets(0) == "R" && edges.targets(1) == "B");
}

void TestRegistryValidatesAndReplaces() {
  graphflow::graph::GraphRegistry registry;

  auto broken = std::make_shared<Graph>("broken");
  bool threw  = false;
  try {
    registry.Register(broken);
  } catch (const graphflow::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(registry.Size() == 0);

  auto first = std::make_shared<Graph>("g");
  first->AddNode("A", Echo).SetStartNode("A");
  auto second = std::make_shared<Graph>("g");
  second->AddNode("B", Echo).SetStartNode("B");
  auto other = std::make_shared<Graph>("a_graph");
  other->AddNode("A", Echo).SetStartNode("A");

  assert(!registry.Register(first));
  assert(registry.Register(second));
  assert(!registry.Register(other));

  assert(registry.Get("g")->StartNode() == "B");
  assert((registry.List() == std::vector<std::string>{"a_graph", "g"}));
  assert(registry.Find("missing") == nullptr);

  threw = false;
  try {
    (void)registry.Get("missing");
  } catch (const graphflow::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestValidGraphPassesValidation();
  TestStartNodeMustBeComputeNode();
  TestDanglingEdgeIsRejected();
  TestRouterTargetsMustBeComputeNodes();
  TestEdgeFromRouterIsRejected();
  TestDuplicateNamesAreRejected();
  TestDescribeListsNodesRoutersAndEdges();
  TestRegistryValidatesAndReplaces();

  std::cout << "graphflow_unit_graph: pass\n";
  return 0;
}
