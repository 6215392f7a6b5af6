#include "graph_server.hpp"
#include "grpc_error.hpp"
#include "graphflow/v1.hpp"

namespace graphflow::grpc {

GraphServer::GraphServer(std::shared_ptr<graphflow::service::GraphService> svc)
    : service_(std::move(svc)) {}

::grpc::Status GraphServer::ListGraphs(::grpc::ServerContext*,
                                       const graphflow::v1::ListGraphsRequest* req,
                                       graphflow::v1::ListGraphsResponse* resp) {
  try {
    *resp = service_->ListGraphs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GraphServer::DescribeGraph(::grpc::ServerContext*,
                                          const graphflow::v1::DescribeGraphRequest* req,
                                          graphflow::v1::DescribeGraphResponse* resp) {
  try {
    *resp = service_->DescribeGraph(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GraphServer::Submit(::grpc::ServerContext*,
                                   const graphflow::v1::SubmitRequest* req,
                                   graphflow::v1::SubmitResponse* resp) {
  try {
    *resp = service_->Submit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GraphServer::SubmitFile(::grpc::ServerContext*,
                                       const graphflow::v1::SubmitFileRequest* req,
                                       graphflow::v1::SubmitResponse* resp) {
  try {
    *resp = service_->SubmitFile(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GraphServer::GetOutputs(::grpc::ServerContext*,
                                       const graphflow::v1::GetOutputsRequest* req,
                                       graphflow::v1::GetOutputsResponse* resp) {
  try {
    *resp = service_->GetOutputs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GraphServer::GetInvocation(::grpc::ServerContext*,
                                          const graphflow::v1::GetInvocationRequest* req,
                                          graphflow::v1::GetInvocationResponse* resp) {
  try {
    *resp = service_->GetInvocation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GraphServer::ListInvocations(::grpc::ServerContext*,
                                            const graphflow::v1::ListInvocationsRequest* req,
                                            graphflow::v1::ListInvocationsResponse* resp) {
  try {
    *resp = service_->ListInvocations(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GraphServer::DisposeInvocation(::grpc::ServerContext*,
                                              const graphflow::v1::DisposeInvocationRequest* req,
                                              google::protobuf::Empty*) {
  try {
    service_->DisposeInvocation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

std::vector<std::unique_ptr<::grpc::Service>> BuildServices(std::shared_ptr<graphflow::service::GraphService> graph_service) {
  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<GraphServer>(std::move(graph_service)));
  return services;
}

}
