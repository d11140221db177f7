#include "internal/observability/logging.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdlib>
#include <iterator>
#include <string>
#include <utility>

#include "config/config.pb.h"

#ifdef STOCKROOM_ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace stockroom::observability {
namespace {

constexpr const char* kLoggerName     = "stockroom";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::atomic<bool> g_include_trace_context{false};

thread_local std::string t_tenant_id;
thread_local std::string t_actor_id;

// Environment wins over the config file.
std::string EnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name); value && *value) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool EnvFlagOr(const char* name, bool configured) {
  if (const char* value = std::getenv(name)) {
    const std::string_view flag(value);
    return flag == "1" || flag == "true";
  }
  return configured;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  for (const char c : value) {
    if (c == ' ' || c == '=' || c == '"' || c == '\n' || c == '\t') return true;
  }
  return false;
}

void Append(fmt::memory_buffer& out, std::string_view text) {
  out.append(text.data(), text.data() + text.size());
}

void AppendField(fmt::memory_buffer& out, std::string_view key, std::string_view value) {
  if (!NeedsQuoting(value)) {
    fmt::format_to(std::back_inserter(out), " {}={}", key, value);
    return;
  }
  fmt::format_to(std::back_inserter(out), " {}=\"", key);
  for (const char c : value) {
    switch (c) {
      case '"':
        Append(out, "\\\"");
        break;
      case '\n':
        Append(out, "\\n");
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

#ifdef STOCKROOM_ENABLE_OTEL
void AppendTraceContext(fmt::memory_buffer& out) {
  if (!g_include_trace_context.load(std::memory_order_relaxed)) {
    return;
  }
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }
  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  char trace_hex[32];
  char span_hex[16];
  context.trace_id().ToLowerBase16(trace_hex);
  context.span_id().ToLowerBase16(span_hex);
  AppendField(out, "trace_id", std::string_view(trace_hex, sizeof(trace_hex)));
  AppendField(out, "span_id", std::string_view(span_hex, sizeof(span_hex)));
}
#else
void AppendTraceContext(fmt::memory_buffer&) {
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

ScopedLogContext::ScopedLogContext(std::string tenant_id, std::string actor_id)
    : previous_tenant_(std::exchange(t_tenant_id, std::move(tenant_id))), previous_actor_(std::exchange(t_actor_id, std::move(actor_id))) {
}

ScopedLogContext::~ScopedLogContext() {
  t_tenant_id = std::move(previous_tenant_);
  t_actor_id  = std::move(previous_actor_);
}

void InitializeLogging(const stockroom::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  // stdout is reserved for command output
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName);
  }
  logger->set_pattern(EnvOr("STOCKROOM_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(EnvOr("STOCKROOM_LOG_LEVEL", logging.level(), "info")));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  g_include_trace_context.store(EnvFlagOr("STOCKROOM_LOG_INCLUDE_TRACE_CONTEXT", logging.include_trace_context()), std::memory_order_relaxed);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger_raw();
  if (!logger->should_log(level)) {
    return;
  }

  fmt::memory_buffer line;
  Append(line, message);
  for (const auto& field : fields) {
    AppendField(line, field.key, field.value);
  }
  if (!t_tenant_id.empty()) AppendField(line, "tenant", t_tenant_id);
  if (!t_actor_id.empty()) AppendField(line, "actor", t_actor_id);
  AppendTraceContext(line);

  logger->log(level, "{}", fmt::string_view(line.data(), line.size()));
}

} // namespace stockroom::observability
