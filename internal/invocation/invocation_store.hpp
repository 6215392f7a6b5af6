#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/invocation/invocation.hpp"

namespace graphflow::invocation {

/*
  Table of live invocations, keyed by invocation id.

  Entries stay until Dispose(); nothing is evicted implicitly.
*/
class InvocationStore {
 public:
  std::shared_ptr<Invocation> Create(const std::string& id, const std::string& graph, std::shared_ptr<const graph::Graph> definition = nullptr);

  std::shared_ptr<Invocation> Find(const std::string& id) const;
  std::shared_ptr<Invocation> Get(const std::string& id) const;

  std::vector<graphflow::v1::Record> Query(const std::string& id, const std::string& node) const;

  std::vector<std::string> List() const;
  void                     Dispose(const std::string& id);
  std::size_t              Size() const;

 private:
  mutable std::shared_mutex                          mutex_;
  std::map<std::string, std::shared_ptr<Invocation>> invocations_;
};

} // namespace graphflow::invocation
