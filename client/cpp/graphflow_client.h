#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>

#include <memory>
#include <string>
#include <vector>

#include "graphflow/services/v1/graph_service.grpc.pb.h"
#include "graphflow/v1.hpp"

namespace graphflow::client {

/*
  Remote counterpart of core::GraphRunner over the GraphService RPCs.

  Every call is synchronous and maps a failed RPC to an arrow::Status:
  NOT_FOUND -> KeyError, INVALID_ARGUMENT -> Invalid, everything else
  -> IOError carrying the server message.
*/
class GraphClient {
 public:
  explicit GraphClient(std::shared_ptr<grpc::Channel> channel);

  arrow::Result<std::vector<std::string>> ListGraphs() const;

  arrow::Result<graphflow::v1::GraphDescription> DescribeGraph(const std::string& graph) const;

  arrow::Result<std::string> Submit(const std::string& graph, const google::protobuf::Struct& input) const;

  // Reads the file locally and uploads its bytes.
  arrow::Result<std::string> SubmitFile(const std::string& graph, const std::string& path, const google::protobuf::Struct& metadata = {}) const;

  arrow::Result<graphflow::v1::GetOutputsResponse> GetOutputs(const std::string& invocation_id, const std::string& node) const;

  template <typename T>
  arrow::Result<std::vector<T>> GetOutputsAs(const std::string& invocation_id, const std::string& node) const {
    ARROW_ASSIGN_OR_RAISE(auto resp, GetOutputs(invocation_id, node));

    std::vector<T> out;
    out.reserve(resp.results_size());
    for (const auto& any : resp.results()) {
      T value;
      if (!any.UnpackTo(&value)) {
        return arrow::Status::TypeError("output of ", node, " is ", any.type_url(), ", not ", T::descriptor()->full_name());
      }
      out.push_back(std::move(value));
    }
    return out;
  }

  arrow::Result<graphflow::v1::InvocationSummary> GetInvocation(const std::string& invocation_id) const;

  // Includes failed invocations; an empty graph lists all.
  arrow::Result<std::vector<graphflow::v1::InvocationSummary>> ListInvocations(const std::string& graph = {}) const;

  arrow::Status DisposeInvocation(const std::string& invocation_id) const;

 private:
  std::unique_ptr<graphflow::services::v1::GraphService::Stub> stub_;
};

} // namespace graphflow::client
