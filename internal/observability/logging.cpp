#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace coord::observability {
namespace {

constexpr const char* kLoggerName     = "agent-coordinator";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

thread_local std::string t_project;
thread_local std::string t_route;

std::string EnvOr(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  return (value && *value) ? std::string(value) : fallback;
}

bool TraceContextEnabled(const coord::runtime::config::RuntimeConfig& config) {
  const auto env = EnvOr("COORD_LOG_INCLUDE_TRACE_CONTEXT", "");
  if (!env.empty()) return env == "1" || env == "true";
  return config.logging().include_trace_context();
}

void AppendField(std::string& out, std::string_view key, std::string_view value) {
  if (!out.empty()) out.push_back(' ');
  out.append(key);
  out.push_back('=');
  // values with spaces are quoted so lines stay splittable on ' '
  if (value.find(' ') != std::string_view::npos) {
    out.push_back('"');
    out.append(value);
    out.push_back('"');
  } else {
    out.append(value);
  }
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

void AppendTraceContext(std::string& out) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  AppendField(out, "trace_id", HexId(trace_bytes, 16));
  AppendField(out, "span_id", HexId(span_bytes, 8));
}
#else
void AppendTraceContext(std::string&) {
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

void InitializeLogging(const coord::runtime::config::RuntimeConfig& config) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  const auto file = EnvOr("COORD_LOG_FILE", config.logging().file());
  if (!file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file));
    } catch (const spdlog::spdlog_ex& ex) {
      spdlog::warn("log file {} unavailable: {}", file, ex.what());
    }
  }

  // re-initialization (tests, coordctl after loading config) replaces the logger
  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(EnvOr("COORD_LOG_PATTERN", config.logging().pattern().empty() ? kDefaultPattern : config.logging().pattern()));
  logger->set_level(spdlog::level::from_str(EnvOr("COORD_LOG_LEVEL", config.logging().level().empty() ? "info" : config.logging().level())));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  g_include_trace_context = TraceContextEnabled(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

ScopedLogContext::ScopedLogContext(std::string_view project_id, std::string_view route)
    : saved_project_(t_project), saved_route_(t_route) {
  if (!project_id.empty()) t_project = std::string(project_id);
  if (!route.empty()) t_route = std::string(route);
}

ScopedLogContext::~ScopedLogContext() {
  t_project = std::move(saved_project_);
  t_route   = std::move(saved_route_);
}

std::string CurrentLogContext() {
  std::string out;
  if (!t_project.empty()) AppendField(out, "project", t_project);
  if (!t_route.empty()) AppendField(out, "route", t_route);
  return out;
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::string tail;
  for (const auto& field : fields) AppendField(tail, field.key, field.value);

  auto context = CurrentLogContext();
  if (!context.empty()) {
    if (!tail.empty()) tail.push_back(' ');
    tail += context;
  }
  AppendTraceContext(tail);

  if (tail.empty()) {
    spdlog::log(level, "{}", message);
  } else {
    spdlog::log(level, "{} {}", message, tail);
  }
}

} // namespace coord::observability
