#include "client/cpp/graphflow_client.h"

#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

#include <grpcpp/client_context.h>

namespace graphflow::client {

namespace {

arrow::Status GrpcToArrow(const grpc::Status& status, std::string_view action) {
  switch (status.error_code()) {
    case grpc::StatusCode::OK:
      return arrow::Status::OK();
    case grpc::StatusCode::NOT_FOUND:
      return arrow::Status::KeyError(std::string(action), " failed: ", status.error_message());
    case grpc::StatusCode::INVALID_ARGUMENT:
      return arrow::Status::Invalid(std::string(action), " failed: ", status.error_message());
    default:
      return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
  }
}

} // namespace

GraphClient::GraphClient(std::shared_ptr<grpc::Channel> channel)
    : stub_(graphflow::services::v1::GraphService::NewStub(std::move(channel))) {}

arrow::Result<std::vector<std::string>> GraphClient::ListGraphs() const {
  graphflow::v1::ListGraphsResponse resp;
  grpc::ClientContext               ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->ListGraphs(&ctx, graphflow::v1::ListGraphsRequest{}, &resp), "ListGraphs"));
  return std::vector<std::string>(resp.names().begin(), resp.names().end());
}

arrow::Result<graphflow::v1::GraphDescription> GraphClient::DescribeGraph(const std::string& graph) const {
  graphflow::v1::DescribeGraphRequest req;
  req.set_graph(graph);

  graphflow::v1::DescribeGraphResponse resp;
  grpc::ClientContext                  ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->DescribeGraph(&ctx, req, &resp), "DescribeGraph"));
  return resp.graph();
}

arrow::Result<std::string> GraphClient::Submit(const std::string& graph, const google::protobuf::Struct& input) const {
  graphflow::v1::SubmitRequest req;
  req.set_graph(graph);
  *req.mutable_input() = input;

  graphflow::v1::SubmitResponse resp;
  grpc::ClientContext           ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->Submit(&ctx, req, &resp), "Submit"));
  return resp.invocation_id();
}

arrow::Result<std::string> GraphClient::SubmitFile(const std::string& graph, const std::string& path, const google::protobuf::Struct& metadata) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return arrow::Status::IOError("cannot open ", path);
  }

  graphflow::v1::SubmitFileRequest req;
  req.set_graph(graph);
  auto* file = req.mutable_file();
  file->set_data(std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()));
  file->set_path(path);
  *file->mutable_metadata() = metadata;

  graphflow::v1::SubmitResponse resp;
  grpc::ClientContext           ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->SubmitFile(&ctx, req, &resp), "SubmitFile"));
  return resp.invocation_id();
}

arrow::Result<graphflow::v1::GetOutputsResponse> GraphClient::GetOutputs(const std::string& invocation_id, const std::string& node) const {
  graphflow::v1::GetOutputsRequest req;
  req.set_invocation_id(invocation_id);
  req.set_node(node);

  graphflow::v1::GetOutputsResponse resp;
  grpc::ClientContext               ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->GetOutputs(&ctx, req, &resp), "GetOutputs"));
  return resp;
}

arrow::Result<graphflow::v1::InvocationSummary> GraphClient::GetInvocation(const std::string& invocation_id) const {
  graphflow::v1::GetInvocationRequest req;
  req.set_invocation_id(invocation_id);

  graphflow::v1::GetInvocationResponse resp;
  grpc::ClientContext                  ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->GetInvocation(&ctx, req, &resp), "GetInvocation"));
  return resp.invocation();
}

arrow::Result<std::vector<graphflow::v1::InvocationSummary>> GraphClient::ListInvocations(const std::string& graph) const {
  graphflow::v1::ListInvocationsRequest req;
  req.set_graph(graph);

  graphflow::v1::ListInvocationsResponse resp;
  grpc::ClientContext                    ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->ListInvocations(&ctx, req, &resp), "ListInvocations"));
  return std::vector<graphflow::v1::InvocationSummary>(resp.invocations().begin(), resp.invocations().end());
}

arrow::Status GraphClient::DisposeInvocation(const std::string& invocation_id) const {
  graphflow::v1::DisposeInvocationRequest req;
  req.set_invocation_id(invocation_id);

  google::protobuf::Empty resp;
  grpc::ClientContext     ctx;
  return GrpcToArrow(stub_->DisposeInvocation(&ctx, req, &resp), "DisposeInvocation");
}

} // namespace graphflow::client
