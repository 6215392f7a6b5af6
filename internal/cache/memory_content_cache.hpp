#pragma once

#include <cstddef>
#include <shared_mutex>
#include <unordered_map>

#include "content_cache.hpp"

namespace graphflow::cache {

class MemoryContentCache final : public ContentCache {
 public:
  std::optional<std::vector<std::string>> Get(const std::string& graph, const std::string& node, const std::string& input_key) override;

  void Put(const std::string& graph, const std::string& node, const std::string& input_key, const std::vector<std::string>& outputs) override;

  const char* Name() const override {
    return "memory";
  }

  std::size_t Size() const;

 private:
  static std::string Key(const std::string& graph, const std::string& node, const std::string& input_key);

  mutable std::shared_mutex                                 mutex_;
  std::unordered_map<std::string, std::vector<std::string>> entries_;
};

} // namespace graphflow::cache
