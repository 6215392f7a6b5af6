#include "internal/invocation/invocation_store.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace graphflow::invocation {

std::shared_ptr<Invocation> InvocationStore::Create(const std::string& id, const std::string& graph, std::shared_ptr<const graph::Graph> definition) {
  if (id.empty()) {
    throw util::InvalidArgument("invocation id must not be empty");
  }

  std::unique_lock lock(mutex_);
  if (invocations_.count(id)) {
    throw util::AlreadyExists("invocation already exists: " + id);
  }

  auto invocation = std::make_shared<Invocation>(id, graph, std::move(definition));
  invocations_.emplace(id, invocation);
  return invocation;
}

std::shared_ptr<Invocation> InvocationStore::Find(const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto             it = invocations_.find(id);
  return it == invocations_.end() ? nullptr : it->second;
}

std::shared_ptr<Invocation> InvocationStore::Get(const std::string& id) const {
  auto invocation = Find(id);
  if (!invocation) {
    throw util::NotFound("invocation not found: " + id);
  }
  return invocation;
}

std::vector<graphflow::v1::Record> InvocationStore::Query(const std::string& id, const std::string& node) const {
  auto outputs = Get(id)->Outputs(node);
  if (!outputs) {
    throw util::NotFound("no outputs for node '" + node + "' in invocation " + id);
  }
  return std::move(*outputs);
}

std::vector<std::string> InvocationStore::List() const {
  std::shared_lock         lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(invocations_.size());
  for (const auto& [id, invocation] : invocations_) {
    ids.push_back(id);
  }
  return ids;
}

void InvocationStore::Dispose(const std::string& id) {
  std::unique_lock lock(mutex_);
  if (invocations_.erase(id) == 0) {
    throw util::NotFound("invocation not found: " + id);
  }
}

std::size_t InvocationStore::Size() const {
  std::shared_lock lock(mutex_);
  return invocations_.size();
}

} // namespace graphflow::invocation
