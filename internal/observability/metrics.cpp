#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define COORD_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define COORD_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace coord::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::chrono::milliseconds g_export_interval{1000};

std::string MetricsEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) return config.endpoint;

  for (const char* name : {"OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* endpoint = std::getenv(name)) return endpoint;
  }
  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  for (const auto& [key, value] : config.resource_attributes) attrs.SetAttribute(key, opentelemetry::nostd::string_view(value));
  return resource::Resource::Create(attrs);
}

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
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

// One-label counter increment. The label value must outlive the call.
void AddLabelled(const opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>& counter, std::uint64_t value,
                 opentelemetry::nostd::string_view key, const std::string& label) {
  if (!counter || value == 0) return;
  const std::initializer_list<AttributePair> attributes = {{key, opentelemetry::nostd::string_view(label)}};
  AddWithAttributes(counter, value, attributes);
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> lock_decisions;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> lock_released;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> messages;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> stale_agents;
};

bool InitializeMetrics(const OtlpConfig& config) {
  auto endpoint = MetricsEndpoint(config);

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
  reader_options.export_interval_millis = g_export_interval;
#ifdef COORD_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto resource = BuildResource(config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

bool InitializeMetrics(const coord::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  g_export_interval = std::chrono::milliseconds(observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : 1000);
  return InitializeMetrics(OtlpConfigFromRuntime(config));
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
  impl_->meter  = provider->GetMeter("agent-coordinator", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("coord.request.count", "1", "Coordination calls by route and success");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("coord.request.latency_ms", "ms", "Coordination call latency in milliseconds");
  impl_->lock_decisions     = impl_->meter->CreateUInt64Counter("coord.lock.decisions", "1", "Lock requests by outcome");
  impl_->lock_released      = impl_->meter->CreateUInt64Counter("coord.lock.released", "1", "Released locks by reason");
  impl_->messages           = impl_->meter->CreateUInt64Counter("coord.messages", "1", "Message transitions");
  impl_->stale_agents       = impl_->meter->CreateUInt64Counter("coord.agents.stale", "1", "Stale agents whose locks were released");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) return;

  const std::string                          route_label(route);
  const std::initializer_list<AttributePair> attributes = {{"route", opentelemetry::nostd::string_view(route_label)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) return;

  const std::string                          route_label(route);
  const std::initializer_list<AttributePair> attributes = {{"route", opentelemetry::nostd::string_view(route_label)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordLockDecision(std::string_view outcome) {
  if (impl_) AddLabelled(impl_->lock_decisions, 1, "outcome", std::string(outcome));
}

void Metrics::RecordLockReleased(std::string_view reason, std::uint64_t count) {
  if (impl_) AddLabelled(impl_->lock_released, count, "reason", std::string(reason));
}

void Metrics::RecordMessage(std::string_view transition) {
  if (impl_) AddLabelled(impl_->messages, 1, "transition", std::string(transition));
}

void Metrics::RecordStaleAgents(std::uint64_t count) {
  if (!impl_ || !impl_->stale_agents || count == 0) return;
  impl_->stale_agents->Add(count);
}

} // namespace coord::observability

#endif
