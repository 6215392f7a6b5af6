#pragma once

#include <memory>
#include <vector>
#include <grpcpp/grpcpp.h>

#include "graphflow/services/v1/graph_service.grpc.pb.h"
#include "internal/service/graph_service.hpp"
#include "graphflow/v1.hpp"

namespace graphflow::grpc {

class GraphServer final : public graphflow::services::v1::GraphService::Service {
public:
  explicit GraphServer(std::shared_ptr<graphflow::service::GraphService> svc);

  ::grpc::Status ListGraphs(::grpc::ServerContext*,
                            const graphflow::v1::ListGraphsRequest*,
                            graphflow::v1::ListGraphsResponse*) override;

  ::grpc::Status DescribeGraph(::grpc::ServerContext*,
                               const graphflow::v1::DescribeGraphRequest*,
                               graphflow::v1::DescribeGraphResponse*) override;

  ::grpc::Status Submit(::grpc::ServerContext*,
                        const graphflow::v1::SubmitRequest*,
                        graphflow::v1::SubmitResponse*) override;

  ::grpc::Status SubmitFile(::grpc::ServerContext*,
                            const graphflow::v1::SubmitFileRequest*,
                            graphflow::v1::SubmitResponse*) override;

  ::grpc::Status GetOutputs(::grpc::ServerContext*,
                            const graphflow::v1::GetOutputsRequest*,
                            graphflow::v1::GetOutputsResponse*) override;

  ::grpc::Status GetInvocation(::grpc::ServerContext*,
                               const graphflow::v1::GetInvocationRequest*,
                               graphflow::v1::GetInvocationResponse*) override;

  ::grpc::Status ListInvocations(::grpc::ServerContext*,
                                 const graphflow::v1::ListInvocationsRequest*,
                                 graphflow::v1::ListInvocationsResponse*) override;

  ::grpc::Status DisposeInvocation(::grpc::ServerContext*,
                                   const graphflow::v1::DisposeInvocationRequest*,
                                   google::protobuf::Empty*) override;

private:
  std::shared_ptr<graphflow::service::GraphService> service_;
};

// Transport adapters for every service of the application.
std::vector<std::unique_ptr<::grpc::Service>> BuildServices(std::shared_ptr<graphflow::service::GraphService> graph_service);

}
