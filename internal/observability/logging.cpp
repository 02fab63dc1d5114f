#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace dispatch::observability {
namespace {

constexpr const char* kLoggerName     = "dispatch";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
constexpr std::size_t kDefaultFileSize = 10 * 1024 * 1024;
constexpr std::size_t kDefaultFiles    = 5;

bool g_include_trace_context{false};

// Environment wins over the config block, the config block over the default.
std::string EnvOr(const char* name, const std::string& configured, const std::string& fallback) {
  if (const char* value = std::getenv(name); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool TraceContextRequested(const dispatch::runtime::config::LoggingConfig& logging) {
  if (const char* value = std::getenv("DISPATCH_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string flag(value);
    return flag == "1" || flag == "true";
  }
  return logging.include_trace_context();
}

std::vector<spdlog::sink_ptr> BuildSinks(const dispatch::runtime::config::LoggingConfig& logging) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  const auto file = EnvOr("DISPATCH_LOG_FILE", logging.file(), "");
  if (!file.empty()) {
    const auto max_size  = logging.max_file_size_bytes() > 0 ? static_cast<std::size_t>(logging.max_file_size_bytes()) : kDefaultFileSize;
    const auto max_files = logging.max_files() > 0 ? static_cast<std::size_t>(logging.max_files()) : kDefaultFiles;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, max_size, max_files));
  }
  return sinks;
}

// key=value pairs; values with spaces, '=' or quotes are quoted.
std::string FormatFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  for (auto it = fields.begin(); it != fields.end(); ++it) {
    if (it != fields.begin()) {
      out << ' ';
    }
    out << it->key << '=';
    if (it->value.find_first_of(" =\"") == std::string::npos) {
      out << it->value;
    } else {
      out << std::quoted(it->value);
    }
  }
  return out.str();
}

#ifdef ENABLE_OTEL
template <std::size_t N>
std::string Hex(const uint8_t (&bytes)[N]) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(N * 2);
  for (auto b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0F]);
  }
  return out;
}

std::string CurrentTraceFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }
  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  uint8_t trace_id[16];
  uint8_t span_id[8];
  context.trace_id().CopyBytesTo(trace_id);
  context.span_id().CopyBytesTo(span_id);
  return "trace_id=" + Hex(trace_id) + " span_id=" + Hex(span_id);
}
#else
std::string CurrentTraceFields() {
  return {};
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.3f}", value)};
}

void InitializeLogging(const dispatch::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  auto sinks  = BuildSinks(logging);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(EnvOr("DISPATCH_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(EnvOr("DISPATCH_LOG_LEVEL", logging.level(), "info")));
  logger->flush_on(spdlog::level::warn);

  spdlog::drop(kLoggerName);
  spdlog::set_default_logger(std::move(logger));

  g_include_trace_context = TraceContextRequested(logging);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const std::string& part : {FormatFields(fields), CurrentTraceFields()}) {
    if (!part.empty()) {
      line.push_back(' ');
      line.append(part);
    }
  }
  spdlog::log(level, "{}", line);
}

} // namespace dispatch::observability
