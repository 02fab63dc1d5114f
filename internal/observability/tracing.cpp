#include "internal/observability/spans.hpp"
#include "internal/observability/telemetry.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/always_on_factory.h>
#include <opentelemetry/sdk/trace/samplers/parent_factory.h>
#include <opentelemetry/sdk/trace/samplers/trace_id_ratio_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <mutex>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace dispatch::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

constexpr const char* kTracerName    = "dispatch";
constexpr const char* kTracerVersion = "0.1.0";

std::mutex                                          g_mutex;
std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

opentelemetry::nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  std::lock_guard lock(g_mutex);
  return g_tracer;
}

std::unique_ptr<sdktrace::SpanExporter> BuildExporter(const dispatch::runtime::config::ObservabilityConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, "traces");

  if (config.transport() == dispatch::runtime::config::OTLP_TRANSPORT_HTTP) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

// Root spans are kept at trace_sample_ratio; children follow their parent
// so an accepted offer is never traced without its dispatch batch.
std::unique_ptr<sdktrace::Sampler> BuildSampler(double ratio) {
  std::shared_ptr<sdktrace::Sampler> root;
  if (ratio > 0 && ratio < 1) {
    root = sdktrace::TraceIdRatioBasedSamplerFactory::Create(ratio);
  } else {
    root = sdktrace::AlwaysOnSamplerFactory::Create();
  }
  return sdktrace::ParentBasedSamplerFactory::Create(root);
}

} // namespace

bool InstallTracer(const dispatch::runtime::config::ObservabilityConfig& config, const TelemetryResource& telemetry) {
  resource::ResourceAttributes attributes;
  for (const auto& [key, value] : telemetry.Labels()) {
    attributes.SetAttribute(key, opentelemetry::nostd::string_view(value));
  }

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(BuildExporter(config), sdktrace::BatchSpanProcessorOptions{});
  std::unique_ptr<sdktrace::TracerProvider> provider =
      sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attributes), BuildSampler(config.trace_sample_ratio()));

  std::lock_guard lock(g_mutex);
  g_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  g_tracer = g_provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(g_tracer);
}

void UninstallTracer() {
  std::lock_guard lock(g_mutex);
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) {
  auto tracer = CurrentTracer();
  if (!tracer) {
    return;
  }

  impl_        = std::make_unique<Impl>();
  impl_->span  = tracer->StartSpan(opentelemetry::nostd::string_view(name.data(), name.size()));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) {
    impl_->span->SetAttribute(opentelemetry::nostd::string_view(key.data(), key.size()),
                              opentelemetry::nostd::string_view(value.data(), value.size()));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_) {
    impl_->span->SetAttribute(opentelemetry::nostd::string_view(key.data(), key.size()), value);
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_) {
    const std::string message(description);
    impl_->span->AddEvent("exception", {{"exception.message", opentelemetry::nostd::string_view(message)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, message);
  }
}

} // namespace dispatch::observability

#else

namespace dispatch::observability {

struct SpanScope::Impl {};

bool InstallTracer(const dispatch::runtime::config::ObservabilityConfig&, const TelemetryResource&) {
  return false;
}

void UninstallTracer() {
}

SpanScope::SpanScope(std::string_view) {
}

SpanScope::~SpanScope() = default;

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

void SpanScope::RecordException(std::string_view) {
}

} // namespace dispatch::observability

#endif
