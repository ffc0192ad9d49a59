#include "internal/observability/metrics.hpp"

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
#include <opentelemetry/sdk/resource/resource.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace meshdispatch::observability {
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

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

bool InstallProvider(const OtlpConfig& config, std::chrono::milliseconds interval) {
  auto endpoint = ResolveEndpoint(config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = interval;
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> inbound_dropped;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> malformed_frames;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> retransmits;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> ack_exhausted;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> units_offline;
};

bool InitializeMetrics(const OtlpConfig& config) {
  return InstallProvider(config, std::chrono::milliseconds(1000));
}

bool InitializeMetrics(const meshdispatch::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == meshdispatch::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  const auto interval_ms = observability.collection_interval_ms() > 0 ? observability.collection_interval_ms() : 1000;
  return InstallProvider(otlp_config, std::chrono::milliseconds(interval_ms));
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
  impl_->meter  = provider->GetMeter("mesh-dispatch", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("dispatch.request.count", "1", "Total number of dispatcher requests");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("dispatch.request.latency_ms", "ms", "Dispatcher request latency in milliseconds");
  impl_->inbound_dropped    = impl_->meter->CreateUInt64Counter("radio.inbound.dropped", "1", "Frames dropped from a full inbound queue");
  impl_->malformed_frames   = impl_->meter->CreateUInt64Counter("radio.inbound.malformed", "1", "Frames that failed to decode");
  impl_->retransmits        = impl_->meter->CreateUInt64Counter("radio.outbound.retransmits", "1", "Reliable frames re-sent after an ack timeout");
  impl_->ack_exhausted      = impl_->meter->CreateUInt64Counter("radio.outbound.ack_exhausted", "1", "Reliable frames that ran out of attempts");
  impl_->units_offline      = impl_->meter->CreateUInt64Counter("units.offline", "1", "Units marked offline by the staleness sweep");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  const std::string                          route_label(route);
  const std::initializer_list<AttributePair> attributes = {{"route", route_label}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  const std::string                          route_label(route);
  const std::initializer_list<AttributePair> attributes = {{"route", route_label}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordInboundDropped() {
  if (!impl_ || !impl_->inbound_dropped) {
    return;
  }
  AddWithAttributes(impl_->inbound_dropped, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
}

void Metrics::RecordMalformedFrame() {
  if (!impl_ || !impl_->malformed_frames) {
    return;
  }
  AddWithAttributes(impl_->malformed_frames, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
}

void Metrics::RecordRetransmit(std::string_view kind) {
  if (!impl_ || !impl_->retransmits) {
    return;
  }
  const std::string                          kind_label(kind);
  const std::initializer_list<AttributePair> attributes = {{"kind", kind_label}};
  AddWithAttributes(impl_->retransmits, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordAckExhausted(std::string_view kind) {
  if (!impl_ || !impl_->ack_exhausted) {
    return;
  }
  const std::string                          kind_label(kind);
  const std::initializer_list<AttributePair> attributes = {{"kind", kind_label}};
  AddWithAttributes(impl_->ack_exhausted, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordUnitOffline() {
  if (!impl_ || !impl_->units_offline) {
    return;
  }
  AddWithAttributes(impl_->units_offline, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
}

} // namespace meshdispatch::observability

#endif
