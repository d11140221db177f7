#include "internal/observability/otlp_config.hpp"

#ifdef STOCKROOM_ENABLE_OTEL

#include <cstdlib>

#include "config/config.pb.h"

namespace stockroom::observability {

OtlpConfig LoadOtlpConfig(const stockroom::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp;
  otlp.endpoint  = observability.otlp_endpoint();
  otlp.transport = observability.transport() == stockroom::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  otlp.tenant_id = config.tenant().tenant_id();
  if (!observability.service_name().empty()) {
    otlp.service_name = observability.service_name();
  }
  if (observability.collection_interval_ms() > 0) {
    otlp.collection_interval_ms = observability.collection_interval_ms();
  }
  return otlp;
}

std::string ResolveEndpoint(const OtlpConfig& config, OtlpSignal signal) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  const char* signal_env = signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  for (const char* name : {signal_env, "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* endpoint = std::getenv(name); endpoint && *endpoint) {
      return endpoint;
    }
  }

  if (config.transport == OtlpTransport::kGrpc) {
    return "localhost:4317";
  }
  return signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

opentelemetry::sdk::resource::Resource BuildResource(const OtlpConfig& config) {
  opentelemetry::sdk::resource::ResourceAttributes attributes = {
      {"service.name", config.service_name},
      {"service.namespace", std::string("retail")},
  };
  if (!config.tenant_id.empty()) {
    attributes.SetAttribute("stockroom.tenant_id", config.tenant_id);
  }
  return opentelemetry::sdk::resource::Resource::Create(attributes);
}

} // namespace stockroom::observability

#endif
