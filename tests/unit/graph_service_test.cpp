#include "internal/service/graph_service.hpp"

#include <cassert>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "graphflow/examples/v1/text.pb.h"
#include "internal/cache/memory_content_cache.hpp"
#include "internal/core/graph_runner.hpp"
#include "internal/graph/graph.hpp"
#include "internal/graphs/text_pipeline.hpp"
#include "internal/model/record.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace graphflow::v1;
using graphflow::service::GraphService;

graphflow::service::ServiceContext BuildServiceContext() {
  graphflow::service::ServiceContext ctx;
  ctx.runner = std::make_shared<graphflow::core::GraphRunner>(std::make_shared<graphflow::cache::MemoryContentCache>());
  ctx.runner->Register(graphflow::graphs::BuildTextPipeline());
  return ctx;
}

std::string SubmitText(GraphService& service, const std::string& text) {
  SubmitRequest req;
  req.set_graph("text_pipeline");
  (*req.mutable_input()->mutable_fields())["text"].set_string_value(text);
  return service.Submit(req).invocation_id();
}

void TestListAndDescribeGraphs() {
  GraphService service(BuildServiceContext());

  const auto graphs = service.ListGraphs(ListGraphsRequest{});
  assert(graphs.names_size() == 1);
  assert(graphs.names(0) == "text_pipeline");

  DescribeGraphRequest req;
  req.set_graph("text_pipeline");
  const auto described = service.DescribeGraph(req);
  assert(described.graph().start_node() == "extract_text");
  assert(described.graph().nodes_size() == 6);
}

void TestSubmitAndGetOutputs() {
  GraphService service(BuildServiceContext());
  const auto   id = SubmitText(service, "First one. Second one.");

  GetOutputsRequest req;
  req.set_invocation_id(id);
  req.set_node("count_words");
  const auto outputs = service.GetOutputs(req);

  assert(outputs.results_size() == 2);
  assert(outputs.records_size() == 2);

  graphflow::examples::v1::WordCount count;
  assert(outputs.results(1).UnpackTo(&count));
  assert(count.sentence_index() == 1);
  assert(count.words() == 2);

  GetInvocationRequest inv_req;
  inv_req.set_invocation_id(id);
  const auto invocation = service.GetInvocation(inv_req).invocation();
  assert(invocation.state() == INVOCATION_STATE_COMPLETED);
  assert(invocation.work_items() > 0);
}

void TestSubmitFileUsesUploadedBytes() {
  GraphService service(BuildServiceContext());

  SubmitFileRequest req;
  req.set_graph("text_pipeline");
  req.mutable_file()->set_data("Uploaded text.");
  const auto id = service.SubmitFile(req).invocation_id();

  GetOutputsRequest out_req;
  out_req.set_invocation_id(id);
  out_req.set_node("extract_text");
  const auto outputs = service.GetOutputs(out_req);

  graphflow::examples::v1::Document document;
  assert(outputs.results(0).UnpackTo(&document));
  assert(document.text() == "Uploaded text.");
  assert(document.source() == "file");
}

void TestMissingFieldsAreInvalidArgument() {
  GraphService service(BuildServiceContext());

  bool threw = false;
  try {
    service.Submit(SubmitRequest{});
  } catch (const graphflow::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    SubmitFileRequest req;
    req.set_graph("text_pipeline");
    service.SubmitFile(req);
  } catch (const graphflow::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestDisposeInvocation() {
  GraphService service(BuildServiceContext());
  const auto   id = SubmitText(service, "Short.");

  DisposeInvocationRequest req;
  req.set_invocation_id(id);
  service.DisposeInvocation(req);

  bool threw = false;
  try {
    service.DisposeInvocation(req);
  } catch (const graphflow::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void RegisterFailingGraph(graphflow::service::ServiceContext& ctx) {
  auto graph = std::make_shared<graphflow::graph::Graph>("failing");
  graph->AddNode("ok", [](const Record& in) { return std::vector<Record>{graphflow::model::MakeRecord(in.payload())}; })
      .AddNode("bad", [](const Record&) -> std::vector<Record> { throw graphflow::util::FunctionExecutionError("boom"); })
      .AddEdge("ok", "bad")
      .SetStartNode("ok");
  ctx.runner->Register(graph);
}

void TestFailedSubmitReportsInvocationId() {
  auto ctx = BuildServiceContext();
  RegisterFailingGraph(ctx);
  GraphService service(ctx);

  SubmitRequest req;
  req.set_graph("failing");

  std::string failed_id;
  try {
    service.Submit(req);
  } catch (const graphflow::util::InvocationFailed& e) {
    failed_id = e.InvocationId();
    assert(std::string(e.what()).find("boom") != std::string::npos);
    assert(std::string(e.what()).find(failed_id) != std::string::npos);

    bool original = false;
    try {
      std::rethrow_exception(e.Cause());
    } catch (const graphflow::util::FunctionExecutionError&) {
      original = true;
    }
    assert(original);
  }
  assert(!failed_id.empty());

  GetOutputsRequest out_req;
  out_req.set_invocation_id(failed_id);
  out_req.set_node("ok");
  const auto partial = service.GetOutputs(out_req);
  assert(partial.records_size() == 1);

  GetInvocationRequest inv_req;
  inv_req.set_invocation_id(failed_id);
  const auto invocation = service.GetInvocation(inv_req).invocation();
  assert(invocation.state() == INVOCATION_STATE_FAILED);
  assert(invocation.error() == "boom");
}

void TestSubmitUsesRequestedInvocationId() {
  auto ctx = BuildServiceContext();
  RegisterFailingGraph(ctx);
  GraphService service(ctx);

  SubmitRequest req;
  req.set_graph("text_pipeline");
  req.set_invocation_id("chosen-1");
  (*req.mutable_input()->mutable_fields())["text"].set_string_value("Picked id.");
  assert(service.Submit(req).invocation_id() == "chosen-1");

  // Reusing the id is rejected before anything runs and is not reported
  // as a failed invocation.
  bool threw = false;
  try {
    req.set_graph("failing");
    service.Submit(req);
  } catch (const graphflow::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);

  GetInvocationRequest inv_req;
  inv_req.set_invocation_id("chosen-1");
  assert(service.GetInvocation(inv_req).invocation().state() == INVOCATION_STATE_COMPLETED);
}

void TestUnknownGraphIsNotWrapped() {
  GraphService service(BuildServiceContext());

  SubmitRequest req;
  req.set_graph("missing");

  bool threw = false;
  try {
    service.Submit(req);
  } catch (const graphflow::util::InvocationFailed&) {
    assert(false && "No invocation exists for an unknown graph.");
  } catch (const graphflow::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestListInvocationsIncludesFailedRuns() {
  auto ctx = BuildServiceContext();
  RegisterFailingGraph(ctx);
  GraphService service(ctx);

  const auto ok_id = SubmitText(service, "Fine.");

  SubmitRequest req;
  req.set_graph("failing");
  req.set_invocation_id("will-fail");
  bool threw = false;
  try {
    service.Submit(req);
  } catch (const graphflow::util::InvocationFailed&) {
    threw = true;
  }
  assert(threw);

  const auto all = service.ListInvocations(ListInvocationsRequest{});
  assert(all.invocations_size() == 2);

  ListInvocationsRequest filtered_req;
  filtered_req.set_graph("failing");
  const auto filtered = service.ListInvocations(filtered_req);
  assert(filtered.invocations_size() == 1);
  assert(filtered.invocations(0).id() == "will-fail");
  assert(filtered.invocations(0).state() == INVOCATION_STATE_FAILED);

  DisposeInvocationRequest dispose;
  dispose.set_invocation_id("will-fail");
  service.DisposeInvocation(dispose);

  const auto remaining = service.ListInvocations(ListInvocationsRequest{});
  assert(remaining.invocations_size() == 1);
  assert(remaining.invocations(0).id() == ok_id);
}

} // namespace

int main() {
  TestListAndDescribeGraphs();
  TestSubmitAndGetOutputs();
  TestSubmitFileUsesUploadedBytes();
  TestMissingFieldsAreInvalidArgument();
  TestDisposeInvocation();
  TestFailedSubmitReportsInvocationId();
  TestSubmitUsesRequestedInvocationId();
  TestUnknownGraphIsNotWrapped();
  TestListInvocationsIncludesFailedRuns();

  std::cout << "graphflow_unit_graph_service: pass\n";
  return 0;
}
