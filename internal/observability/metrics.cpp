#include "internal/observability/spans.hpp"

#ifdef STOCKROOM_ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
// The reader factory moved between SDK releases.
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define STOCKROOM_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define STOCKROOM_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif

#include "config/config.pb.h"
#include "internal/observability/otlp_config.hpp"

namespace stockroom::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

using Attribute  = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Attributes = std::initializer_list<Attribute>;

template <typename T>
using Instrument = opentelemetry::nostd::shared_ptr<T>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveEndpoint(config, OtlpSignal::kMetrics);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

std::unique_ptr<sdkmetrics::MetricReader> MakeReader(const OtlpConfig& config) {
  sdkmetrics::PeriodicExportingMetricReaderOptions options;
  options.export_interval_millis = std::chrono::milliseconds(config.collection_interval_ms);
#ifdef STOCKROOM_OTEL_METRIC_READER_FACTORY
  return sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(config), options);
#else
  return std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(MakeExporter(config), options);
#endif
}

template <typename Provider>
void AttachReader(Provider& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider.AddMetricReader(std::move(reader)); }) {
    provider.AddMetricReader(std::move(reader));
  } else {
    provider.AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename T, typename Value>
void Add(const Instrument<T>& instrument, Value value, Attributes attributes) {
  if (!instrument) return;
  if constexpr (requires { instrument->Add(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Add(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Add(value, attributes);
  }
}

template <typename T, typename Value>
void Record(const Instrument<T>& instrument, Value value, Attributes attributes) {
  if (!instrument) return;
  if constexpr (requires { instrument->Record(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Record(value, attributes);
  }
}

std::uint64_t Magnitude(std::int64_t value) {
  return static_cast<std::uint64_t>(value < 0 ? -value : value);
}

} // namespace

struct Metrics::Impl {
  Instrument<metrics_api::Counter<std::uint64_t>> operations;
  Instrument<metrics_api::Histogram<double>>      operation_latency_ms;
  Instrument<metrics_api::Counter<std::uint64_t>> stock_units_moved;
  Instrument<metrics_api::Counter<std::uint64_t>> sales;
  Instrument<metrics_api::Counter<std::uint64_t>> sales_amount;
  Instrument<metrics_api::Histogram<double>>      shift_cash_difference;
};

bool InitializeMetrics(const stockroom::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = LoadOtlpConfig(config);
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           BuildResource(otlp_config));
  AttachReader(*g_provider, MakeReader(otlp_config));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (!g_provider) {
    return;
  }
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter("stockroom", "0.1.0");

  impl_->operations           = meter->CreateUInt64Counter("stockroom.operations", "1", "Service operations by outcome");
  impl_->operation_latency_ms = meter->CreateDoubleHistogram("stockroom.operation.duration", "ms", "Service operation latency");
  impl_->stock_units_moved    = meter->CreateUInt64Counter("stockroom.stock.units_moved", "1", "Stock units moved through the ledger");
  impl_->sales                = meter->CreateUInt64Counter("stockroom.sales", "1", "Completed till transactions by type");
  impl_->sales_amount         = meter->CreateUInt64Counter("stockroom.sales.amount", "cents", "Absolute transaction totals by type");
  impl_->shift_cash_difference =
      meter->CreateDoubleHistogram("stockroom.shift.cash_difference", "cents", "Counted minus expected cash at shift close");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordOperation(std::string_view operation, std::string_view outcome) {
  const std::string operation_label(operation);
  const std::string outcome_label(outcome);
  Add(impl_->operations, std::uint64_t{1}, {{"operation", operation_label}, {"outcome", outcome_label}});
}

void Metrics::ObserveOperationLatencyMs(std::string_view operation, double latency_ms) {
  const std::string operation_label(operation);
  Record(impl_->operation_latency_ms, latency_ms, {{"operation", operation_label}});
}

void Metrics::RecordStockMovement(std::string_view source, std::int64_t quantity) {
  if (quantity == 0) {
    return;
  }
  const std::string source_label(source);
  Add(impl_->stock_units_moved, Magnitude(quantity), {{"source", source_label}, {"direction", quantity < 0 ? "out" : "in"}});
}

void Metrics::RecordSale(std::string_view type, std::int64_t total) {
  const std::string type_label(type);
  Add(impl_->sales, std::uint64_t{1}, {{"type", type_label}});
  Add(impl_->sales_amount, Magnitude(total), {{"type", type_label}});
}

void Metrics::RecordShiftClose(std::int64_t difference) {
  Record(impl_->shift_cash_difference, static_cast<double>(difference), {});
}

} // namespace stockroom::observability

#endif
