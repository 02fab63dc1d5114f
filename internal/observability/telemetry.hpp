#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dispatch::runtime::config {
class ObservabilityConfig;
class RuntimeConfig;
}

namespace dispatch::observability {

/*
  Identity of this dispatch core as seen by the trace and metric
  backends. Every exported span and data point carries these labels so
  deployments sharing one collector can be told apart.
*/
struct TelemetryResource {
  std::string service_name{"dispatch-server"};
  std::string environment;
  std::string region;
  std::string store_backend; // memory | sqlite | postgres

  // OTel resource attributes; empty labels are left out.
  std::vector<std::pair<std::string, std::string>> Labels() const;
};

TelemetryResource ResourceFromConfig(const dispatch::runtime::config::RuntimeConfig& config);

// signal is "traces" or "metrics". Configured endpoint, then the
// OTEL_EXPORTER_OTLP_* environment, then the collector default.
std::string ResolveOtlpEndpoint(const dispatch::runtime::config::ObservabilityConfig& config, std::string_view signal);

// Installs the tracer and meter providers the config enables. Returns
// true when at least one exporter is running. Without ENABLE_OTEL this
// is a no-op returning false.
bool InitializeTelemetry(const dispatch::runtime::config::RuntimeConfig& config);
void ShutdownTelemetry();

// Per-signal installers behind InitializeTelemetry.
bool InstallTracer(const dispatch::runtime::config::ObservabilityConfig& config, const TelemetryResource& resource);
bool InstallMeter(const dispatch::runtime::config::ObservabilityConfig& config, const TelemetryResource& resource);
void UninstallTracer();
void UninstallMeter();

} // namespace dispatch::observability
