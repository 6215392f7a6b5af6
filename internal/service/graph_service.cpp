#include "graph_service.hpp"

#include <chrono>
#include <stdexcept>
#include <string_view>
#include <type_traits>

#include "internal/core/graph_runner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/typing/typed_view.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace graphflow::service {

using namespace graphflow::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string* invocation_id, Fn&& fn) {
  graphflow::observability::SpanScope span(route);
  if (invocation_id) {
    span.SetAttribute("invocation.id", *invocation_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      graphflow::observability::Metrics::Instance().RecordRequest(route, true);
      graphflow::observability::Metrics::Instance().ObserveRequestLatencyMs(
          route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
      return;
    } else {
      auto result = fn();
      graphflow::observability::Metrics::Instance().RecordRequest(route, true);
      graphflow::observability::Metrics::Instance().ObserveRequestLatencyMs(
          route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    GRAPHFLOW_LOG_ERROR("RPC failed", {graphflow::observability::StringField("route", route), graphflow::observability::StringField("error", ex.what()),
                                       graphflow::observability::StringField("invocation_id", invocation_id ? *invocation_id : std::string{})});
    graphflow::observability::Metrics::Instance().RecordRequest(route, false);
    graphflow::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

void RequireField(const std::string& value, const char* name) {
  if (value.empty()) {
    throw graphflow::util::InvalidArgument(std::string(name) + " is required");
  }
}

// Runs a submission under a known invocation id. A traversal failure
// leaves a FAILED invocation behind; its id travels with the error.
template <typename Fn>
std::string SubmitTracked(const graphflow::core::GraphRunner& runner, const std::string& requested_id, Fn&& submit) {
  const auto invocation_id = requested_id.empty() ? graphflow::util::NewId() : requested_id;
  const bool existed       = runner.FindInvocation(invocation_id).has_value();

  try {
    return submit(invocation_id);
  } catch (const std::exception& e) {
    if (existed) {
      throw;
    }
    const auto summary = runner.FindInvocation(invocation_id);
    if (!summary || summary->state() != INVOCATION_STATE_FAILED) {
      throw;
    }
    throw graphflow::util::InvocationFailed(invocation_id, std::current_exception(), e.what());
  }
}

} // namespace

GraphService::GraphService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.runner) {
    throw std::invalid_argument("graph service requires a runner");
  }
}

ListGraphsResponse GraphService::ListGraphs(const ListGraphsRequest&) {
  return ObserveRpc("GraphService.ListGraphs", nullptr, [&] {
    ListGraphsResponse resp;
    for (const auto& name : ctx_.runner->ListGraphs()) {
      resp.add_names(name);
    }
    return resp;
  });
}

DescribeGraphResponse GraphService::DescribeGraph(const DescribeGraphRequest& req) {
  return ObserveRpc("GraphService.DescribeGraph", nullptr, [&] {
    RequireField(req.graph(), "graph");

    DescribeGraphResponse resp;
    *resp.mutable_graph() = ctx_.runner->Describe(req.graph());
    return resp;
  });
}

SubmitResponse GraphService::Submit(const SubmitRequest& req) {
  return ObserveRpc("GraphService.Submit", nullptr, [&] {
    RequireField(req.graph(), "graph");

    SubmitResponse resp;
    resp.set_invocation_id(SubmitTracked(*ctx_.runner, req.invocation_id(),
                                         [&](const std::string& id) { return ctx_.runner->Submit(req.graph(), req.input(), id); }));
    return resp;
  });
}

SubmitResponse GraphService::SubmitFile(const SubmitFileRequest& req) {
  return ObserveRpc("GraphService.SubmitFile", nullptr, [&] {
    RequireField(req.graph(), "graph");
    if (!req.has_file()) {
      throw graphflow::util::InvalidArgument("file is required");
    }

    SubmitResponse resp;
    resp.set_invocation_id(SubmitTracked(*ctx_.runner, req.invocation_id(),
                                         [&](const std::string& id) { return ctx_.runner->SubmitFile(req.graph(), req.file(), id); }));
    return resp;
  });
}

GetOutputsResponse GraphService::GetOutputs(const GetOutputsRequest& req) {
  return ObserveRpc("GraphService.GetOutputs", &req.invocation_id(), [&] {
    RequireField(req.invocation_id(), "invocation_id");
    RequireField(req.node(), "node");

    const auto type_name = ctx_.runner->DeclaredOutputType(req.invocation_id(), req.node());

    GetOutputsResponse resp;
    for (const auto& record : ctx_.runner->Query(req.invocation_id(), req.node())) {
      *resp.add_results() = graphflow::typing::ToAny(record, type_name);
      *resp.add_records() = record;
    }
    return resp;
  });
}

GetInvocationResponse GraphService::GetInvocation(const GetInvocationRequest& req) {
  return ObserveRpc("GraphService.GetInvocation", &req.invocation_id(), [&] {
    RequireField(req.invocation_id(), "invocation_id");

    GetInvocationResponse resp;
    *resp.mutable_invocation() = ctx_.runner->GetInvocation(req.invocation_id());
    return resp;
  });
}

ListInvocationsResponse GraphService::ListInvocations(const ListInvocationsRequest& req) {
  return ObserveRpc("GraphService.ListInvocations", nullptr, [&] {
    ListInvocationsResponse resp;
    for (const auto& id : ctx_.runner->ListInvocations()) {
      // Disposed between listing and lookup.
      auto summary = ctx_.runner->FindInvocation(id);
      if (!summary) {
        continue;
      }
      if (!req.graph().empty() && summary->graph() != req.graph()) {
        continue;
      }
      *resp.add_invocations() = std::move(*summary);
    }
    return resp;
  });
}

void GraphService::DisposeInvocation(const DisposeInvocationRequest& req) {
  ObserveRpc("GraphService.DisposeInvocation", &req.invocation_id(), [&] {
    RequireField(req.invocation_id(), "invocation_id");
    ctx_.runner->Dispose(req.invocation_id());
  });
}

}
