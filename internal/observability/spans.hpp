#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace stockroom::runtime::config {
class RuntimeConfig;
}

namespace stockroom::observability {

/*
  Tracing and metrics facade.

  Every service operation runs under one SpanScope; the core reports stock
  movements, till transactions and shift closes through Metrics. Built
  without STOCKROOM_ENABLE_OTEL every call below is an inline no-op, so call
  sites never need their own #ifdefs.

  Exporter endpoints follow the OTEL_EXPORTER_OTLP_* environment variables
  when the config leaves observability.otlp_endpoint empty.
*/

bool InitializeTracing(const stockroom::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const stockroom::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef STOCKROOM_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // outcome is the OutcomeCodeName of the result ("ok", "not_found", ...)
  void RecordOperation(std::string_view operation, std::string_view outcome);
  void ObserveOperationLatencyMs(std::string_view operation, double latency_ms);
  // Units moved through the ledger, by source ("sale", "purchase_order", ...)
  void RecordStockMovement(std::string_view source, std::int64_t quantity);
  // type is "Sale" or "Return"; total in cents, negative for returns
  void RecordSale(std::string_view type, std::int64_t total);
  void RecordShiftClose(std::int64_t difference);

 private:
  Metrics();
#ifdef STOCKROOM_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef STOCKROOM_ENABLE_OTEL
inline bool InitializeTracing(const stockroom::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const stockroom::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordOperation(std::string_view, std::string_view) {
}

inline void Metrics::ObserveOperationLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordStockMovement(std::string_view, std::int64_t) {
}

inline void Metrics::RecordSale(std::string_view, std::int64_t) {
}

inline void Metrics::RecordShiftClose(std::int64_t) {
}
#endif

} // namespace stockroom::observability
