#pragma once

#include <google/protobuf/empty.pb.h>

#include "graphflow/v1.hpp"
#include "service_context.hpp"

namespace graphflow::service {

/*
  Request/response facade over the GraphRunner.

  Transport independent: the gRPC adapter and tests call it directly.
  Every call runs inside a span and records request metrics; failures
  are logged and rethrown unchanged.
*/
class GraphService {
public:
  explicit GraphService(ServiceContext ctx);

  graphflow::v1::ListGraphsResponse
  ListGraphs(const graphflow::v1::ListGraphsRequest& req);

  graphflow::v1::DescribeGraphResponse
  DescribeGraph(const graphflow::v1::DescribeGraphRequest& req);

  graphflow::v1::SubmitResponse
  Submit(const graphflow::v1::SubmitRequest& req);

  graphflow::v1::SubmitResponse
  SubmitFile(const graphflow::v1::SubmitFileRequest& req);

  graphflow::v1::GetOutputsResponse
  GetOutputs(const graphflow::v1::GetOutputsRequest& req);

  graphflow::v1::GetInvocationResponse
  GetInvocation(const graphflow::v1::GetInvocationRequest& req);

  graphflow::v1::ListInvocationsResponse
  ListInvocations(const graphflow::v1::ListInvocationsRequest& req);

  void DisposeInvocation(const graphflow::v1::DisposeInvocationRequest& req);

private:
  ServiceContext ctx_;
};

}
