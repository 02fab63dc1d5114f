#include "internal/observability/telemetry.hpp"

#include <cctype>
#include <cstdlib>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

namespace dispatch::observability {

namespace {

constexpr std::string_view kGrpcCollector = "localhost:4317";
constexpr std::string_view kHttpCollector = "http://localhost:4318";

std::string Upper(std::string_view value) {
  std::string out(value);
  for (auto& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

const char* NonEmptyEnv(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  return value != nullptr && *value != '\0' ? value : nullptr;
}

} // namespace

std::vector<std::pair<std::string, std::string>> TelemetryResource::Labels() const {
  std::vector<std::pair<std::string, std::string>> labels{{"service.name", service_name}};
  if (!environment.empty()) {
    labels.emplace_back("deployment.environment", environment);
  }
  if (!region.empty()) {
    labels.emplace_back("dispatch.region", region);
  }
  if (!store_backend.empty()) {
    labels.emplace_back("dispatch.store", store_backend);
  }
  return labels;
}

TelemetryResource ResourceFromConfig(const dispatch::runtime::config::RuntimeConfig& config) {
  using dispatch::runtime::config::DatabaseConfig;

  TelemetryResource resource;
  resource.environment = config.observability().environment();
  resource.region      = config.observability().region();
  switch (config.database().backend_case()) {
    case DatabaseConfig::kSqlite:
      resource.store_backend = "sqlite";
      break;
    case DatabaseConfig::kPostgres:
      resource.store_backend = "postgres";
      break;
    default:
      resource.store_backend = "memory";
      break;
  }
  return resource;
}

std::string ResolveOtlpEndpoint(const dispatch::runtime::config::ObservabilityConfig& config, std::string_view signal) {
  const bool http = config.transport() == dispatch::runtime::config::OTLP_TRANSPORT_HTTP;

  std::string endpoint = config.otlp_endpoint();
  if (endpoint.empty()) {
    if (const char* value = NonEmptyEnv("OTEL_EXPORTER_OTLP_" + Upper(signal) + "_ENDPOINT")) {
      // signal-specific variables are used verbatim
      return value;
    }
    if (const char* value = NonEmptyEnv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
      endpoint = value;
    }
  }
  if (endpoint.empty()) {
    endpoint = http ? std::string(kHttpCollector) : std::string(kGrpcCollector);
  }
  if (!http) {
    return endpoint;
  }

  // OTLP/HTTP posts each signal to its own path under the base URL
  const std::string path = "/v1/" + std::string(signal);
  if (endpoint.size() >= path.size() && endpoint.compare(endpoint.size() - path.size(), path.size(), path) == 0) {
    return endpoint;
  }
  if (!endpoint.empty() && endpoint.back() == '/') {
    endpoint.pop_back();
  }
  return endpoint + path;
}

bool InitializeTelemetry(const dispatch::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  const auto  resource      = ResourceFromConfig(config);

  bool tracing = false;
  bool metrics = false;
  if (observability.tracing_enabled()) {
    tracing = InstallTracer(observability, resource);
  }
  if (observability.metrics_enabled()) {
    metrics = InstallMeter(observability, resource);
  }

  if ((observability.tracing_enabled() && !tracing) || (observability.metrics_enabled() && !metrics)) {
    DISPATCH_LOG_WARN("telemetry requested but this build has no OpenTelemetry exporter");
  } else if (tracing || metrics) {
    DISPATCH_LOG_INFO("telemetry exporting", {StringField("traces", tracing ? ResolveOtlpEndpoint(observability, "traces") : "off"),
                                              StringField("metrics", metrics ? ResolveOtlpEndpoint(observability, "metrics") : "off"),
                                              StringField("store", resource.store_backend)});
  }
  return tracing || metrics;
}

void ShutdownTelemetry() {
  UninstallMeter();
  UninstallTracer();
}

} // namespace dispatch::observability
