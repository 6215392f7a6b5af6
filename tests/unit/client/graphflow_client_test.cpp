#include "client/cpp/graphflow_client.h"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <grpcpp/server_builder.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "graphflow/examples/v1/text.pb.h"
#include "internal/cache/memory_content_cache.hpp"
#include "internal/core/graph_runner.hpp"
#include "internal/graphs/text_pipeline.hpp"
#include "internal/grpc/graph_server.hpp"
#include "internal/service/graph_service.hpp"

namespace {

using graphflow::client::GraphClient;

// Graph service reachable through an in-process channel.
struct InProcessServer {
  InProcessServer() {
    graphflow::service::ServiceContext ctx;
    ctx.runner = std::make_shared<graphflow::core::GraphRunner>(std::make_shared<graphflow::cache::MemoryContentCache>());
    ctx.runner->Register(graphflow::graphs::BuildTextPipeline());

    adapter = std::make_unique<graphflow::grpc::GraphServer>(std::make_shared<graphflow::service::GraphService>(ctx));

    grpc::ServerBuilder builder;
    builder.RegisterService(adapter.get());
    server = builder.BuildAndStart();
    assert(server);
  }

  ~InProcessServer() {
    server->Shutdown();
  }

  GraphClient Client() {
    return GraphClient(server->InProcessChannel(grpc::ChannelArguments()));
  }

  std::unique_ptr<graphflow::grpc::GraphServer> adapter;
  std::unique_ptr<grpc::Server>                 server;
};

void TestSubmitAndTypedOutputs() {
  InProcessServer server;
  auto            client = server.Client();

  auto graphs = client.ListGraphs();
  assert(graphs.ok());
  assert(graphs->size() == 1);

  google::protobuf::Struct input;
  (*input.mutable_fields())["text"].set_string_value("One. Two words.");

  auto id = client.Submit("text_pipeline", input);
  assert(id.ok());

  auto counts = client.GetOutputsAs<graphflow::examples::v1::WordCount>(*id, "count_words");
  assert(counts.ok());
  assert(counts->size() == 2);
  assert((*counts)[1].words() == 2);

  auto wrong_type = client.GetOutputsAs<graphflow::examples::v1::Summary>(*id, "count_words");
  assert(!wrong_type.ok());
  assert(wrong_type.status().IsTypeError());
}

void TestServerErrorsMapToStatusKinds() {
  InProcessServer server;
  auto            client = server.Client();

  auto missing_graph = client.DescribeGraph("missing");
  assert(!missing_graph.ok());
  assert(missing_graph.status().IsKeyError());

  auto empty_graph = client.DescribeGraph("");
  assert(!empty_graph.ok());
  assert(empty_graph.status().IsInvalid());

  const auto dispose = client.DisposeInvocation("no-such-invocation");
  assert(!dispose.ok());
  assert(dispose.IsKeyError());
}

void TestSubmitFileUploadsLocalFile() {
  InProcessServer server;
  auto            client = server.Client();

  const auto path = std::filesystem::temp_directory_path() / "graphflow_client_test_input.txt";
  {
    std::ofstream out(path, std::ios::binary);
    out << "From a file.";
  }

  auto id = client.SubmitFile("text_pipeline", path.string());
  assert(id.ok());

  auto documents = client.GetOutputsAs<graphflow::examples::v1::Document>(*id, "extract_text");
  assert(documents.ok());
  assert(documents->front().text() == "From a file.");
  assert(documents->front().source() == path.string());

  auto summary = client.GetInvocation(*id);
  assert(summary.ok());
  assert(summary->state() == graphflow::v1::INVOCATION_STATE_COMPLETED);

  std::filesystem::remove(path);

  auto unreadable = client.SubmitFile("text_pipeline", path.string());
  assert(!unreadable.ok());
  assert(unreadable.status().IsIOError());
}

void TestFailedSubmitIsListed() {
  InProcessServer server;
  auto            client = server.Client();

  google::protobuf::Struct no_text;
  (*no_text.mutable_fields())["other"].set_string_value("x");

  auto failed = client.Submit("text_pipeline", no_text);
  assert(!failed.ok());
  assert(failed.status().IsIOError());
  assert(failed.status().message().find("invocation_id=") != std::string::npos);

  auto listed = client.ListInvocations("text_pipeline");
  assert(listed.ok());
  assert(listed->size() == 1);
  assert(listed->front().state() == graphflow::v1::INVOCATION_STATE_FAILED);
  assert(failed.status().message().find(listed->front().id()) != std::string::npos);

  assert(client.DisposeInvocation(listed->front().id()).ok());
  auto after = client.ListInvocations();
  assert(after.ok());
  assert(after->empty());
}

void TestUnreachableServerIsIOError() {
  GraphClient client(grpc::CreateChannel("dns:///127.0.0.1:1", grpc::InsecureChannelCredentials()));

  auto graphs = client.ListGraphs();
  assert(!graphs.ok());
  assert(graphs.status().IsIOError());
}

} // namespace

int main() {
  TestSubmitAndTypedOutputs();
  TestServerErrorsMapToStatusKinds();
  TestSubmitFileUploadsLocalFile();
  TestFailedSubmitIsListed();
  TestUnreachableServerIsIOError();

  std::cout << "graphflow_unit_client: pass\n";
  return 0;
}
