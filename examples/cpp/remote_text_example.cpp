#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <string>

#include "client/cpp/graphflow_client.h"
#include "graphflow/examples/v1/text.pb.h"

int main(int argc, char** argv) {
  // Optional target parameter allows this walkthrough to run against any
  // reachable graphflow endpoint.
  const std::string target = argc > 1 ? argv[1] : "localhost:50061";

  graphflow::client::GraphClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  auto graphs = client.ListGraphs();
  if (!graphs.ok()) {
    std::cerr << "ListGraphs failed: " << graphs.status().ToString() << '\n';
    return 1;
  }
  for (const auto& name : *graphs) {
    std::cout << "graph " << name << '\n';
  }

  google::protobuf::Struct input;
  (*input.mutable_fields())["text"].set_string_value("Short text. Two sentences.");

  auto invocation_id = client.Submit("text_pipeline", input);
  if (!invocation_id.ok()) {
    std::cerr << "Submit failed: " << invocation_id.status().ToString() << '\n';
    return 1;
  }

  auto summaries = client.GetOutputsAs<graphflow::examples::v1::Summary>(*invocation_id, "summarize_short");
  if (!summaries.ok()) {
    std::cerr << "GetOutputs failed: " << summaries.status().ToString() << '\n';
    return 1;
  }
  for (const auto& summary : *summaries) {
    std::cout << "summary (" << summary.length_class() << ", " << summary.words() << " words): " << summary.text() << '\n';
  }

  // Nodes the router did not pick have no outputs.
  auto skipped = client.GetOutputs(*invocation_id, "summarize_long");
  std::cout << "summarize_long: " << (skipped.ok() ? "unexpected outputs" : skipped.status().ToString()) << '\n';

  auto disposed = client.DisposeInvocation(*invocation_id);
  if (!disposed.ok()) {
    std::cerr << "DisposeInvocation failed: " << disposed.ToString() << '\n';
    return 1;
  }
  return 0;
}
