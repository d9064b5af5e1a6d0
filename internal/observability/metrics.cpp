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
#include <opentelemetry/sdk/resource/resource.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace fleetwatch::observability {
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

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      cycle_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> probe_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> skipped_ticks;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> alert_count;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   failing_devices_gauge;

  std::atomic<std::int64_t> failing_devices{0};
};

bool InitializeMetrics(const fleetwatch::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == fleetwatch::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  auto endpoint = ResolveEndpoint(otlp_config);

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
  const auto interval_ms = observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : 5000;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
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
  impl_->meter  = provider->GetMeter("fleetwatch", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("fleetwatch.request.count", "Total number of API requests", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("fleetwatch.request.latency_ms", "API request latency in milliseconds", "ms");
  impl_->cycle_duration_ms  = impl_->meter->CreateDoubleHistogram("fleetwatch.cycle.duration_ms", "Polling cycle duration in milliseconds", "ms");
  impl_->probe_count        = impl_->meter->CreateUInt64Counter("fleetwatch.probe.count", "Probe outcomes by reachability", "1");
  impl_->skipped_ticks      = impl_->meter->CreateUInt64Counter("fleetwatch.cycle.skipped_ticks", "Ticks dropped because a cycle was running", "1");
  impl_->alert_count        = impl_->meter->CreateUInt64Counter("fleetwatch.alert.count", "Alert notifications by kind and delivery", "1");
  impl_->failing_devices_gauge =
      impl_->meter->CreateInt64ObservableGauge("fleetwatch.devices.failing", "Devices with an open failure streak", "1");
  impl_->failing_devices_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->failing_devices.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }
  // AttributeValue only views the string
  const std::string                          route_name(route);
  const std::initializer_list<AttributePair> attributes = {{"route", route_name}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }
  const std::string                          route_name(route);
  const std::initializer_list<AttributePair> attributes = {{"route", route_name}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::ObserveCycleDurationMs(double duration_ms) {
  if (!impl_ || !impl_->cycle_duration_ms) {
    return;
  }
  RecordWithAttributes(impl_->cycle_duration_ms, duration_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordProbeOutcomes(std::uint64_t reachable, std::uint64_t unreachable) {
  if (!impl_ || !impl_->probe_count) {
    return;
  }
  const std::initializer_list<AttributePair> ok_attributes   = {{"reachable", true}};
  const std::initializer_list<AttributePair> fail_attributes = {{"reachable", false}};
  AddWithAttributes(impl_->probe_count, reachable, ok_attributes);
  AddWithAttributes(impl_->probe_count, unreachable, fail_attributes);
}

void Metrics::RecordSkippedTick() {
  if (!impl_ || !impl_->skipped_ticks) {
    return;
  }
  AddWithAttributes(impl_->skipped_ticks, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
}

void Metrics::RecordAlert(std::string_view kind, bool delivered) {
  if (!impl_ || !impl_->alert_count) {
    return;
  }
  const std::string                          kind_name(kind);
  const std::initializer_list<AttributePair> attributes = {{"kind", kind_name}, {"delivered", delivered}};
  AddWithAttributes(impl_->alert_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::SetFailingDevices(std::uint64_t count) {
  if (!impl_) {
    return;
  }
  impl_->failing_devices.store(static_cast<std::int64_t>(count));
}

} // namespace fleetwatch::observability

#endif
