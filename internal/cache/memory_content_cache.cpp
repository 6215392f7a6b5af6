#include "memory_content_cache.hpp"

#include <mutex>

namespace graphflow::cache {

// Length-prefixed so ("ab", "c") and ("a", "bc") never share a key.
std::string MemoryContentCache::Key(const std::string& graph, const std::string& node, const std::string& input_key) {
  std::string key;
  key.reserve(graph.size() + node.size() + input_key.size() + 24);
  key.append(std::to_string(graph.size())).push_back(':');
  key.append(graph);
  key.append(std::to_string(node.size())).push_back(':');
  key.append(node);
  key.append(input_key);
  return key;
}

std::optional<std::vector<std::string>> MemoryContentCache::Get(const std::string& graph, const std::string& node, const std::string& input_key) {
  std::shared_lock lock(mutex_);

  auto it = entries_.find(Key(graph, node, input_key));
  if (it == entries_.end())
    return std::nullopt;

  return it->second;
}

void MemoryContentCache::Put(const std::string& graph, const std::string& node, const std::string& input_key,
                             const std::vector<std::string>& outputs) {
  auto key = Key(graph, node, input_key);

  std::unique_lock lock(mutex_);
  entries_[std::move(key)] = outputs;
}

std::size_t MemoryContentCache::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

} // namespace graphflow::cache
