#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace graphflow::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

template <typename Instrument, typename Value>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value,
                       const std::initializer_list<AttributePair>& attributes) {
  instrument->Add(value, attributes, opentelemetry::context::Context{});
}

template <typename Instrument, typename Value>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value,
                          const std::initializer_list<AttributePair>& attributes) {
  instrument->Record(value, attributes, opentelemetry::context::Context{});
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> node_invocations;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> dropped_router_edges;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      traversal_ms;
};

bool InitializeMetrics(const graphflow::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  if (!observability.service_name().empty()) {
    otlp_config.service_name = observability.service_name();
  }
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == graphflow::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  const auto endpoint = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto interval_ms = observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("graphflow", "0.1.0");

  impl_->request_count        = impl_->meter->CreateUInt64Counter("graphflow.request.count", "Total number of service requests", "1");
  impl_->request_latency_ms   = impl_->meter->CreateDoubleHistogram("graphflow.request.latency_ms", "End-to-end request latency in milliseconds", "ms");
  impl_->node_invocations     = impl_->meter->CreateUInt64Counter("graphflow.node.work_items", "Work items processed per node", "1");
  impl_->dropped_router_edges = impl_->meter->CreateUInt64Counter("graphflow.router.dropped_edges", "Router targets that named no compute node", "1");
  impl_->traversal_ms         = impl_->meter->CreateDoubleHistogram("graphflow.traversal.duration_ms", "Graph traversal duration in milliseconds", "ms");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), {{"route", std::string(route)}, {"success", success}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, {{"route", std::string(route)}});
}

void Metrics::RecordNodeInvocation(std::string_view graph, std::string_view node, bool cache_hit) {
  if (!impl_ || !impl_->node_invocations) {
    return;
  }
  AddWithAttributes(impl_->node_invocations, static_cast<std::uint64_t>(1),
                    {{"graph", std::string(graph)}, {"node", std::string(node)}, {"cache_hit", cache_hit}});
}

void Metrics::RecordDroppedRouterEdge(std::string_view graph, std::string_view router) {
  if (!impl_ || !impl_->dropped_router_edges) {
    return;
  }
  AddWithAttributes(impl_->dropped_router_edges, static_cast<std::uint64_t>(1), {{"graph", std::string(graph)}, {"router", std::string(router)}});
}

void Metrics::ObserveTraversalMs(std::string_view graph, double duration_ms) {
  if (!impl_ || !impl_->traversal_ms) {
    return;
  }
  RecordWithAttributes(impl_->traversal_ms, duration_ms, {{"graph", std::string(graph)}});
}

} // namespace graphflow::observability

#endif
