#include "internal/core/graph_runner.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

#include "internal/cache/content_cache.hpp"
#include "internal/codec/record_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace graphflow::core {

using namespace graphflow::v1;
using graphflow::observability::IntField;
using graphflow::observability::StringField;

GraphRunner::GraphRunner(std::shared_ptr<cache::ContentCache> cache, engine::EngineOptions options)
    : cache_(std::move(cache)), engine_(cache_, options) {
}

// ------------------------------------------------------------
// graphs
// ------------------------------------------------------------

void GraphRunner::Register(std::shared_ptr<const graph::Graph> graph) {
  if (!graph) {
    throw util::InvalidArgument("cannot register a null graph");
  }

  const auto name = graph->Name();
  if (registry_.Register(std::move(graph))) {
    GRAPHFLOW_LOG_WARN("graph replaced", {StringField("graph", name)});
  } else {
    GRAPHFLOW_LOG_INFO("graph registered", {StringField("graph", name)});
  }
}

std::vector<std::string> GraphRunner::ListGraphs() const {
  return registry_.List();
}

GraphDescription GraphRunner::Describe(const std::string& graph) const {
  return registry_.Get(graph)->Describe();
}

// ------------------------------------------------------------
// submission
// ------------------------------------------------------------

std::string GraphRunner::Submit(const std::string& graph, const google::protobuf::Struct& input, std::string invocation_id) {
  Record initial;
  initial.set_id(std::move(invocation_id));
  initial.set_payload(codec::EncodeFields(input));
  return SubmitRecord(graph, std::move(initial));
}

std::string GraphRunner::SubmitFile(const std::string& graph, const std::filesystem::path& path, const google::protobuf::Struct& metadata) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::NotFound("input file not found: " + path.string());
  }

  File file;
  file.set_data(std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()));
  if (in.bad()) {
    throw std::runtime_error("failed to read input file: " + path.string());
  }
  file.set_path(path.string());
  *file.mutable_metadata() = metadata;

  return SubmitFile(graph, file);
}

std::string GraphRunner::SubmitFile(const std::string& graph, const File& file, std::string invocation_id) {
  File normalized = file;
  if (normalized.mime_type().empty()) {
    normalized.set_mime_type(kDefaultMimeType);
  }

  Record initial;
  initial.set_id(std::move(invocation_id));
  initial.set_payload(codec::EncodeFile(normalized));
  return SubmitRecord(graph, std::move(initial));
}

std::string GraphRunner::SubmitRecord(const std::string& graph_name, Record initial) {
  auto graph = registry_.Get(graph_name);

  if (initial.id().empty()) {
    initial.set_id(util::NewId());
  }
  const auto id         = initial.id();
  auto       invocation = invocations_.Create(id, graph_name, graph);

  try {
    engine_.Run(*graph, initial, *invocation);
  } catch (const std::exception& e) {
    invocation->MarkFailed(e.what());
    GRAPHFLOW_LOG_ERROR("invocation failed", {StringField("graph", graph_name), StringField("invocation_id", id), StringField("error", e.what())});
    throw;
  }

  invocation->MarkCompleted();
  GRAPHFLOW_LOG_INFO("invocation completed",
                     {StringField("graph", graph_name), StringField("invocation_id", id),
                      IntField("work_items", static_cast<std::int64_t>(invocation->Summary().work_items()))});
  return id;
}

// ------------------------------------------------------------
// results
// ------------------------------------------------------------

std::vector<Record> GraphRunner::Query(const std::string& invocation_id, const std::string& node) const {
  return invocations_.Query(invocation_id, node);
}

std::vector<google::protobuf::Any> GraphRunner::QueryAny(const std::string& invocation_id, const std::string& node) const {
  const auto type_name = DeclaredOutputType(invocation_id, node);

  std::vector<google::protobuf::Any> results;
  for (const auto& record : Query(invocation_id, node)) {
    results.push_back(typing::ToAny(record, type_name));
  }
  return results;
}

std::string GraphRunner::DeclaredOutputType(const std::string& invocation_id, const std::string& node) const {
  const auto graph = invocations_.Get(invocation_id)->Definition();
  if (!graph) {
    return {};
  }

  const auto* compute = graph->FindNode(node);
  return compute ? compute->output_type : std::string{};
}

// ------------------------------------------------------------
// invocations
// ------------------------------------------------------------

InvocationSummary GraphRunner::GetInvocation(const std::string& invocation_id) const {
  return invocations_.Get(invocation_id)->Summary();
}

std::optional<InvocationSummary> GraphRunner::FindInvocation(const std::string& invocation_id) const {
  auto invocation = invocations_.Find(invocation_id);
  if (!invocation) {
    return std::nullopt;
  }
  return invocation->Summary();
}

std::vector<std::string> GraphRunner::ListInvocations() const {
  return invocations_.List();
}

void GraphRunner::Dispose(const std::string& invocation_id) {
  invocations_.Dispose(invocation_id);
  GRAPHFLOW_LOG_DEBUG("invocation disposed", {StringField("invocation_id", invocation_id)});
}

} // namespace graphflow::core
