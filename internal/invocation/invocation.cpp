#include "internal/invocation/invocation.hpp"

namespace graphflow::invocation {

using namespace graphflow::v1;

Invocation::Invocation(std::string id, std::string graph, std::shared_ptr<const graph::Graph> definition)
    : id_(std::move(id)), graph_(std::move(graph)), definition_(std::move(definition)), created_at_(util::Now()) {
}

Invocation::Slot& Invocation::SlotFor(const std::string& node) {
  {
    std::shared_lock lock(slots_mutex_);
    auto             it = slots_.find(node);
    if (it != slots_.end()) {
      return *it->second;
    }
  }

  std::unique_lock lock(slots_mutex_);
  auto&            slot = slots_[node];
  if (!slot) {
    slot = std::make_unique<Slot>();
    slot->stats.set_node(node);
  }
  return *slot;
}

void Invocation::Append(const std::string& node, const std::vector<Record>& outputs) {
  auto&           slot = SlotFor(node);
  std::lock_guard lock(slot.mutex);
  slot.visited = true;
  slot.outputs.insert(slot.outputs.end(), outputs.begin(), outputs.end());
  slot.stats.set_outputs(slot.stats.outputs() + outputs.size());
}

std::optional<std::vector<Record>> Invocation::Outputs(const std::string& node) const {
  std::shared_lock lock(slots_mutex_);
  auto             it = slots_.find(node);
  if (it == slots_.end()) {
    return std::nullopt;
  }

  std::lock_guard slot_lock(it->second->mutex);
  if (!it->second->visited) {
    return std::nullopt;
  }
  return it->second->outputs;
}

std::vector<std::string> Invocation::VisitedNodes() const {
  std::shared_lock         lock(slots_mutex_);
  std::vector<std::string> nodes;
  for (const auto& [name, slot] : slots_) {
    std::lock_guard slot_lock(slot->mutex);
    if (slot->visited) {
      nodes.push_back(name);
    }
  }
  return nodes;
}

void Invocation::RecordWorkItem(const std::string& node, bool cache_hit) {
  auto&           slot = SlotFor(node);
  std::lock_guard lock(slot.mutex);
  slot.stats.set_work_items(slot.stats.work_items() + 1);
  if (cache_hit) {
    slot.stats.set_cache_hits(slot.stats.cache_hits() + 1);
  } else {
    slot.stats.set_invocations(slot.stats.invocations() + 1);
  }
}

void Invocation::RecordRouterCall(const std::string& router, std::uint64_t dropped_edges) {
  auto&           slot = SlotFor(router);
  std::lock_guard lock(slot.mutex);
  slot.stats.set_router_calls(slot.stats.router_calls() + 1);
  slot.stats.set_dropped_router_edges(slot.stats.dropped_router_edges() + dropped_edges);
}

void Invocation::RecordFailure(const std::string& node) {
  auto&           slot = SlotFor(node);
  std::lock_guard lock(slot.mutex);
  slot.stats.set_failures(slot.stats.failures() + 1);
}

void Invocation::MarkCompleted() {
  std::lock_guard lock(state_mutex_);
  state_       = INVOCATION_STATE_COMPLETED;
  finished_at_ = util::Now();
}

void Invocation::MarkFailed(const std::string& error) {
  std::lock_guard lock(state_mutex_);
  state_       = INVOCATION_STATE_FAILED;
  error_       = error;
  finished_at_ = util::Now();
}

InvocationState Invocation::State() const {
  std::lock_guard lock(state_mutex_);
  return state_;
}

InvocationSummary Invocation::Summary() const {
  InvocationSummary summary;
  summary.set_id(id_);
  summary.set_graph(graph_);

  {
    std::lock_guard lock(state_mutex_);
    summary.set_state(state_);
    summary.set_error(error_);
    *summary.mutable_created_at() = util::ToProto(created_at_);
    if (finished_at_) {
      *summary.mutable_finished_at() = util::ToProto(*finished_at_);
    }
  }

  std::uint64_t    work_items = 0;
  std::shared_lock lock(slots_mutex_);
  for (const auto& [name, slot] : slots_) {
    std::lock_guard slot_lock(slot->mutex);
    *summary.add_nodes() = slot->stats;
    work_items += slot->stats.work_items();
  }
  summary.set_work_items(work_items);
  return summary;
}

} // namespace graphflow::invocation
