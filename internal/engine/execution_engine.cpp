#include "internal/engine/execution_engine.hpp"

#include <chrono>
#include <deque>
#include <stdexcept>

#include "internal/cache/content_cache.hpp"
#include "internal/codec/record_codec.hpp"
#include "internal/graph/graph.hpp"
#include "internal/invocation/invocation.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace graphflow::engine {

using namespace graphflow::v1;
using graphflow::observability::DoubleField;
using graphflow::observability::IntField;
using graphflow::observability::StringField;

ExecutionEngine::ExecutionEngine(std::shared_ptr<cache::ContentCache> cache, EngineOptions options)
    : cache_(std::move(cache)), options_(options) {
  if (!cache_) {
    throw std::invalid_argument("execution engine requires a content cache");
  }
  if (options_.max_work_items == 0) {
    options_.max_work_items = EngineOptions{}.max_work_items;
  }
}

void ExecutionEngine::Run(const graph::Graph& graph, const Record& input, invocation::Invocation& invocation) const {
  observability::SpanScope span("ExecutionEngine.Run");
  span.SetAttribute("graph", graph.Name());
  span.SetAttribute("invocation.id", invocation.Id());

  const auto started_at = std::chrono::steady_clock::now();

  std::deque<WorkItem> queue;
  queue.push_back(WorkItem{graph.StartNode(), input});

  std::uint64_t processed = 0;
  while (!queue.empty()) {
    WorkItem item = std::move(queue.front());
    queue.pop_front();

    if (++processed > options_.max_work_items) {
      span.RecordException("step budget exceeded");
      throw util::StepBudgetExceeded("invocation " + invocation.Id() + " on graph '" + graph.Name() + "' exceeded " +
                                     std::to_string(options_.max_work_items) + " work items");
    }

    auto outputs = Evaluate(graph, item, invocation);
    invocation.Append(item.node, outputs);

    const auto successors = ResolveSuccessors(graph, item.node, outputs, invocation);
    for (const auto& successor : successors) {
      for (const auto& output : outputs) {
        queue.push_back(WorkItem{successor, output});
      }
    }
  }

  const double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  observability::Metrics::Instance().ObserveTraversalMs(graph.Name(), elapsed_ms);
  span.SetAttribute("work_items", static_cast<std::int64_t>(processed));

  GRAPHFLOW_LOG_DEBUG("traversal finished", {StringField("graph", graph.Name()), StringField("invocation_id", invocation.Id()),
                                             IntField("work_items", static_cast<std::int64_t>(processed)), DoubleField("elapsed_ms", elapsed_ms)});
}

std::vector<Record> ExecutionEngine::Evaluate(const graph::Graph& graph, const WorkItem& item, invocation::Invocation& invocation) const {
  const auto input_key = codec::CacheKey(item.input);

  if (auto cached = cache_->Get(graph.Name(), item.node, input_key)) {
    invocation.RecordWorkItem(item.node, true);
    observability::Metrics::Instance().RecordNodeInvocation(graph.Name(), item.node, true);

    std::vector<Record> outputs;
    outputs.reserve(cached->size());
    for (const auto& encoded : *cached) {
      outputs.push_back(codec::Decode(encoded));
    }
    return outputs;
  }

  invocation.RecordWorkItem(item.node, false);
  observability::Metrics::Instance().RecordNodeInvocation(graph.Name(), item.node, false);

  std::vector<Record> outputs;
  try {
    outputs = graph.Invoke(item.node, item.input);
  } catch (const std::exception& e) {
    invocation.RecordFailure(item.node);
    GRAPHFLOW_LOG_DEBUG("node failed", {StringField("graph", graph.Name()), StringField("node", item.node), StringField("error", e.what())});
    throw;
  }

  std::vector<std::string> encoded;
  encoded.reserve(outputs.size());
  for (const auto& output : outputs) {
    encoded.push_back(codec::Encode(output));
  }
  cache_->Put(graph.Name(), item.node, input_key, encoded);

  return outputs;
}

std::vector<std::string> ExecutionEngine::ResolveSuccessors(const graph::Graph& graph, const std::string& node, const std::vector<Record>& outputs,
                                                            invocation::Invocation& invocation) const {
  std::vector<std::string> effective;
  std::vector<std::string> discovered;

  for (const auto& successor : graph.Successors(node)) {
    if (graph.IsNode(successor)) {
      effective.push_back(successor);
      continue;
    }

    if (!graph.IsRouter(successor)) {
      throw util::UnknownNodeError("graph '" + graph.Name() + "': successor '" + successor + "' of '" + node + "' is not a node");
    }

    for (const auto& output : outputs) {
      RouterOutput routed;
      try {
        routed = graph.InvokeRouter(successor, output);
      } catch (const std::exception& e) {
        invocation.RecordFailure(successor);
        GRAPHFLOW_LOG_DEBUG("router failed", {StringField("graph", graph.Name()), StringField("router", successor), StringField("error", e.what())});
        throw;
      }

      std::uint64_t dropped = 0;
      for (const auto& edge : routed.edges()) {
        if (graph.IsNode(edge)) {
          discovered.push_back(edge);
          continue;
        }
        ++dropped;
        observability::Metrics::Instance().RecordDroppedRouterEdge(graph.Name(), successor);
        GRAPHFLOW_LOG_DEBUG("router edge dropped", {StringField("graph", graph.Name()), StringField("router", successor), StringField("edge", edge)});
      }
      invocation.RecordRouterCall(successor, dropped);
    }
  }

  effective.insert(effective.end(), discovered.begin(), discovered.end());
  return effective;
}

} // namespace graphflow::engine
