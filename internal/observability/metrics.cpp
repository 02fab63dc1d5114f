#include "internal/observability/metrics.hpp"

#include "internal/observability/telemetry.hpp"

#ifdef ENABLE_OTEL
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

#include <atomic>
#include <chrono>
#include <utility>

#include "config/config.pb.h"
#endif

namespace dispatch::observability {

std::string_view DispatchOutcomeName(DispatchOutcome outcome) {
  switch (outcome) {
    case DispatchOutcome::kMatched:
      return "matched";
    case DispatchOutcome::kNoMatch:
      return "no_match";
    case DispatchOutcome::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

} // namespace dispatch::observability

#ifdef ENABLE_OTEL


namespace dispatch::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;
namespace nostd       = opentelemetry::nostd;

namespace {

constexpr std::uint32_t kDefaultExportIntervalMs = 10000;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

nostd::string_view View(std::string_view value) {
  return nostd::string_view(value.data(), value.size());
}

nostd::string_view ServiceLabel(dispatch::core::v1::ServiceType service) {
  return View(dispatch::core::v1::ServiceType_Name(service));
}

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const dispatch::runtime::config::ObservabilityConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, "metrics");

  if (config.transport() == dispatch::runtime::config::OTLP_TRANSPORT_HTTP) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

struct Metrics::Impl {
  nostd::shared_ptr<metrics_api::Meter> meter;

  nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> dispatch_outcomes;
  nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> offers_issued;
  nostd::shared_ptr<metrics_api::Histogram<double>>      time_to_match_ms;
  nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> notifications;
  nostd::shared_ptr<metrics_api::ObservableInstrument>   live_connections_gauge;

  std::atomic<std::int64_t> live_connections{0};
};

bool InstallMeter(const dispatch::runtime::config::ObservabilityConfig& config, const TelemetryResource& telemetry) {
  resource::ResourceAttributes attributes;
  for (const auto& [key, value] : telemetry.Labels()) {
    attributes.SetAttribute(key, nostd::string_view(value));
  }

  const auto interval_ms = config.metric_export_interval_ms() > 0 ? config.metric_export_interval_ms() : kDefaultExportIntervalMs;

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);
  reader_options.export_timeout_millis  = std::chrono::milliseconds(interval_ms / 2);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(config), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attributes));
  g_provider->AddMetricReader(std::move(reader));
  metrics_api::Provider::SetMeterProvider(nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  Metrics::Instance().Rebind();
  return true;
}

void UninstallMeter() {
  if (!g_provider) {
    return;
  }
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  Rebind();
}

Metrics::~Metrics() = default;

void Metrics::Rebind() {
  auto& m = *impl_;
  m.meter = metrics_api::Provider::GetMeterProvider()->GetMeter("dispatch", "0.1.0");

  m.request_count      = m.meter->CreateUInt64Counter("dispatch.rpc.count", "RPCs handled, by route and result", "1");
  m.request_latency_ms = m.meter->CreateDoubleHistogram("dispatch.rpc.latency", "RPC latency", "ms");
  m.dispatch_outcomes  = m.meter->CreateUInt64Counter("dispatch.trip.outcome", "Trips leaving the search, by outcome and service type", "1");
  m.offers_issued      = m.meter->CreateUInt64Counter("dispatch.offer.issued", "Offers sent to workers, by batch number", "1");
  m.time_to_match_ms   = m.meter->CreateDoubleHistogram("dispatch.trip.time_to_match", "Searching to assigned", "ms");
  m.notifications      = m.meter->CreateUInt64Counter("dispatch.notify.delivery", "Real-time event deliveries, by result", "1");

  m.live_connections_gauge = m.meter->CreateInt64ObservableGauge("dispatch.notify.connections", "Open real-time connections", "1");
  m.live_connections_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl     = static_cast<Impl*>(state);
        auto  observer = nostd::get<nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        observer->Observe(impl->live_connections.load());
      },
      impl_.get());
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  impl_->request_count->Add(1, {{"rpc.route", View(route)}, {"rpc.success", success}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  impl_->request_latency_ms->Record(latency_ms, {{"rpc.route", View(route)}}, opentelemetry::context::Context{});
}

void Metrics::RecordDispatchOutcome(DispatchOutcome outcome, dispatch::core::v1::ServiceType service) {
  impl_->dispatch_outcomes->Add(1, {{"outcome", View(DispatchOutcomeName(outcome))}, {"service_type", ServiceLabel(service)}});
}

void Metrics::RecordOffersIssued(std::uint64_t count, std::uint32_t batch_number) {
  impl_->offers_issued->Add(count, {{"batch", static_cast<std::int64_t>(batch_number)}});
}

void Metrics::ObserveTimeToMatchMs(double latency_ms, dispatch::core::v1::ServiceType service) {
  impl_->time_to_match_ms->Record(latency_ms, {{"service_type", ServiceLabel(service)}}, opentelemetry::context::Context{});
}

void Metrics::RecordNotification(bool delivered) {
  impl_->notifications->Add(1, {{"delivered", delivered}});
}

void Metrics::SetLiveConnections(std::int64_t count) {
  impl_->live_connections.store(count);
}

} // namespace dispatch::observability

#else

namespace dispatch::observability {

struct Metrics::Impl {};

bool InstallMeter(const dispatch::runtime::config::ObservabilityConfig&, const TelemetryResource&) {
  return false;
}

void UninstallMeter() {
}

Metrics::Metrics() = default;

Metrics::~Metrics() = default;

void Metrics::Rebind() {
}

void Metrics::RecordRequest(std::string_view, bool) {
}

void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

void Metrics::RecordDispatchOutcome(DispatchOutcome, dispatch::core::v1::ServiceType) {
}

void Metrics::RecordOffersIssued(std::uint64_t, std::uint32_t) {
}

void Metrics::ObserveTimeToMatchMs(double, dispatch::core::v1::ServiceType) {
}

void Metrics::RecordNotification(bool) {
}

void Metrics::SetLiveConnections(std::int64_t) {
}

} // namespace dispatch::observability

#endif
