#pragma once

#include <optional>
#include <string>
#include <vector>

namespace graphflow::cache {

/*
  Content-addressed memoization store.

  Entries are keyed by (graph, node, input_key) where input_key is the
  canonical serialization of a node's input record (codec::CacheKey).
  Values are the encoded output records of that node, in production order.

  CRITICAL GUARANTEES:

  - Get is a pure lookup
  - A Put is atomic: readers see the old entry or the whole new one
  - Safe to call from concurrent traversals
  - Disabling the cache changes cost, never observable outputs
*/
class ContentCache {
 public:
  virtual ~ContentCache() = default;

  virtual std::optional<std::vector<std::string>> Get(const std::string& graph, const std::string& node, const std::string& input_key) = 0;

  virtual void Put(const std::string& graph, const std::string& node, const std::string& input_key,
                   const std::vector<std::string>& outputs) = 0;

  // Backend name for logs.
  virtual const char* Name() const = 0;
};

/*
  Always-miss cache. Every traversal recomputes every node.
*/
class DisabledContentCache final : public ContentCache {
 public:
  std::optional<std::vector<std::string>> Get(const std::string&, const std::string&, const std::string&) override {
    return std::nullopt;
  }

  void Put(const std::string&, const std::string&, const std::string&, const std::vector<std::string>&) override {
  }

  const char* Name() const override {
    return "disabled";
  }
};

} // namespace graphflow::cache
