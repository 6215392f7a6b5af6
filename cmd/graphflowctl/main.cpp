#include <grpcpp/grpcpp.h>

#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

#include "graphflow/services/v1/graph_service.grpc.pb.h"
#include "graphflow/v1.hpp"

using namespace graphflow::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  graphflowctl <addr> graphs\n"
            << "  graphflowctl <addr> describe <graph>\n"
            << "  graphflowctl <addr> submit <graph> [key=value ...]\n"
            << "  graphflowctl <addr> submit-file <graph> <path>\n"
            << "  graphflowctl <addr> outputs <invocation> <node>\n"
            << "  graphflowctl <addr> invocation <invocation>\n"
            << "  graphflowctl <addr> invocations [graph]\n"
            << "  graphflowctl <addr> dispose <invocation>\n";
}

// key=value -> Struct field; true/false and numbers keep their type.
static bool AddField(const std::string& arg, google::protobuf::Struct* fields) {
  const auto eq = arg.find('=');
  if (eq == std::string::npos || eq == 0) {
    return false;
  }

  const auto key   = arg.substr(0, eq);
  const auto value = arg.substr(eq + 1);
  auto&      field = (*fields->mutable_fields())[key];

  if (value == "true" || value == "false") {
    field.set_bool_value(value == "true");
    return true;
  }

  char*        endptr  = nullptr;
  const double numeric = std::strtod(value.c_str(), &endptr);
  if (!value.empty() && endptr && *endptr == '\0') {
    field.set_number_value(numeric);
    return true;
  }

  field.set_string_value(value);
  return true;
}

static std::string ToJson(const google::protobuf::Message& message) {
  std::string                              json;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    return "<" + message.GetTypeName() + ": " + std::string(status.message()) + ">";
  }
  return json;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = GraphService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "graphs") {
    ListGraphsResponse resp;
    auto               status = stub->ListGraphs(&ctx, ListGraphsRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& name : resp.names()) {
      std::cout << name << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "describe") {
    if (argc < 4) return 1;

    DescribeGraphRequest req;
    req.set_graph(argv[3]);

    DescribeGraphResponse resp;
    auto                  status = stub->DescribeGraph(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << ToJson(resp.graph()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "submit") {
    if (argc < 4) return 1;

    SubmitRequest req;
    req.set_graph(argv[3]);
    for (int i = 4; i < argc; ++i) {
      if (!AddField(argv[i], req.mutable_input())) {
        std::cerr << "invalid field, expected key=value: " << argv[i] << "\n";
        return 1;
      }
    }

    SubmitResponse resp;
    auto           status = stub->Submit(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.invocation_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "submit-file") {
    if (argc < 5) return 1;

    std::ifstream in(argv[4], std::ios::binary);
    if (!in) {
      std::cerr << "cannot open " << argv[4] << "\n";
      return 1;
    }

    SubmitFileRequest req;
    req.set_graph(argv[3]);
    req.mutable_file()->set_data(std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()));
    req.mutable_file()->set_path(argv[4]);

    SubmitResponse resp;
    auto           status = stub->SubmitFile(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.invocation_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "outputs") {
    if (argc < 5) return 1;

    GetOutputsRequest req;
    req.set_invocation_id(argv[3]);
    req.set_node(argv[4]);

    GetOutputsResponse resp;
    auto               status = stub->GetOutputs(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (int i = 0; i < resp.results_size(); ++i) {
      std::cout << resp.records(i).id() << " " << ToJson(resp.results(i)) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "invocation") {
    if (argc < 4) return 1;

    GetInvocationRequest req;
    req.set_invocation_id(argv[3]);

    GetInvocationResponse resp;
    auto                  status = stub->GetInvocation(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << ToJson(resp.invocation()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "invocations") {
    ListInvocationsRequest req;
    if (argc >= 4) req.set_graph(argv[3]);

    ListInvocationsResponse resp;
    auto                    status = stub->ListInvocations(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& invocation : resp.invocations()) {
      std::cout << invocation.id() << " " << invocation.graph() << " " << InvocationState_Name(invocation.state()) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "dispose") {
    if (argc < 4) return 1;

    DisposeInvocationRequest req;
    req.set_invocation_id(argv[3]);

    google::protobuf::Empty resp;
    auto                    status = stub->DisposeInvocation(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "disposed\n";
    return 0;
  }

  Usage();
  return 1;
}
