#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace stockroom::runtime::config {
class RuntimeConfig;
}

namespace stockroom::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Installs the process-wide "stockroom" logger. Safe to call again; the
// existing logger is reconfigured.
void InitializeLogging(const stockroom::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

/*
  Tags every line logged on this thread with tenant= and actor= while in
  scope. Nested scopes restore the outer values on exit.
*/
class ScopedLogContext {
 public:
  ScopedLogContext(std::string tenant_id, std::string actor_id);
  ~ScopedLogContext();

  ScopedLogContext(const ScopedLogContext&)            = delete;
  ScopedLogContext& operator=(const ScopedLogContext&) = delete;

 private:
  std::string previous_tenant_;
  std::string previous_actor_;
};

// Lines look like: message key=value key="two words" tenant=... actor=...
void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace stockroom::observability

#define STOCKROOM_LOG_DEBUG(message, ...) ::stockroom::observability::LogDebug((message), ##__VA_ARGS__)
#define STOCKROOM_LOG_INFO(message, ...) ::stockroom::observability::LogInfo((message), ##__VA_ARGS__)
#define STOCKROOM_LOG_WARN(message, ...) ::stockroom::observability::LogWarn((message), ##__VA_ARGS__)
#define STOCKROOM_LOG_ERROR(message, ...) ::stockroom::observability::LogError((message), ##__VA_ARGS__)
