#pragma once

#ifdef STOCKROOM_ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <cstdint>
#include <string>

namespace stockroom::runtime::config {
class RuntimeConfig;
}

namespace stockroom::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

// Exporter settings shared by the trace and metric pipelines.
struct OtlpConfig {
  std::string   service_name{"stockroom"};
  std::string   tenant_id;
  std::string   endpoint;
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t collection_interval_ms{1000};
};

OtlpConfig LoadOtlpConfig(const stockroom::runtime::config::RuntimeConfig& config);

// Config value, then OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, then
// OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
std::string ResolveEndpoint(const OtlpConfig& config, OtlpSignal signal);

opentelemetry::sdk::resource::Resource BuildResource(const OtlpConfig& config);

} // namespace stockroom::observability

#endif
