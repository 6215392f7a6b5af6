#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/any.pb.h>
#include <google/protobuf/struct.pb.h>

#include "graphflow/v1.hpp"
#include "internal/engine/execution_engine.hpp"
#include "internal/graph/graph_registry.hpp"
#include "internal/invocation/invocation_store.hpp"
#include "internal/typing/typed_view.hpp"

namespace graphflow::cache {
class ContentCache;
}

namespace graphflow::core {

// mime_type of submitted files that do not name one.
inline constexpr const char* kDefaultMimeType = "application/octet-stream";

/*
  GraphRunner

  In-process entry point: owns the graph registry, the invocation store
  and the engine (which shares the content cache).

  Lifecycle of an invocation:
    Submit*  -> create accumulator, run traversal synchronously
    Query*   -> read outputs by (invocation id, node)
    Dispose  -> drop the accumulator

  Submit returns only after the traversal ends. A failed traversal leaves
  the invocation in FAILED state with its partial outputs and rethrows.
*/
class GraphRunner {
 public:
  explicit GraphRunner(std::shared_ptr<cache::ContentCache> cache, engine::EngineOptions options = {});

  // graphs

  void                            Register(std::shared_ptr<const graph::Graph> graph);
  std::vector<std::string>        ListGraphs() const;
  graphflow::v1::GraphDescription Describe(const std::string& graph) const;

  // submission

  // An empty invocation_id gets a fresh one.
  std::string Submit(const std::string& graph, const google::protobuf::Struct& input, std::string invocation_id = {});
  std::string SubmitFile(const std::string& graph, const std::filesystem::path& path, const google::protobuf::Struct& metadata = {});
  std::string SubmitFile(const std::string& graph, const graphflow::v1::File& file, std::string invocation_id = {});

  // Runs with an explicit initial record. The record id becomes the
  // invocation id; an empty id gets a fresh one.
  std::string SubmitRecord(const std::string& graph, graphflow::v1::Record initial);

  // results

  std::vector<graphflow::v1::Record> Query(const std::string& invocation_id, const std::string& node) const;
  std::vector<google::protobuf::Any> QueryAny(const std::string& invocation_id, const std::string& node) const;

  template <typename T>
  std::vector<T> QueryAs(const std::string& invocation_id, const std::string& node) const {
    const auto declared = DeclaredOutputType(invocation_id, node);
    if (!declared.empty() && declared != T::descriptor()->full_name()) {
      throw util::InvalidArgument("node '" + node + "' produces " + declared + ", not " + T::descriptor()->full_name());
    }

    std::vector<T> results;
    for (const auto& record : Query(invocation_id, node)) {
      results.push_back(typing::DecodeAs<T>(record));
    }
    return results;
  }

  // Declared output type of a node in the graph the invocation ran on,
  // empty when the node declares none.
  std::string DeclaredOutputType(const std::string& invocation_id, const std::string& node) const;

  // invocations

  graphflow::v1::InvocationSummary                GetInvocation(const std::string& invocation_id) const;
  std::optional<graphflow::v1::InvocationSummary> FindInvocation(const std::string& invocation_id) const;
  std::vector<std::string>                        ListInvocations() const;
  void                                            Dispose(const std::string& invocation_id);

  const cache::ContentCache& Cache() const {
    return *cache_;
  }

 private:
  std::shared_ptr<cache::ContentCache> cache_;
  engine::ExecutionEngine              engine_;
  graph::GraphRegistry                 registry_;
  invocation::InvocationStore          invocations_;
};

} // namespace graphflow::core
