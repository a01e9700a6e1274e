#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

#include "config/config.pb.h"

namespace ingest::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }
  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> upload_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> job_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      provider_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   queue_depth_gauge;

  std::mutex                          queue_depth_mutex;
  std::map<std::string, std::int64_t> queue_depth_values;
};

bool InitializeMetrics(const ingest::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = ToOtlpConfig(config);
  const auto endpoint    = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(otlp_config.metrics_interval_ms);
  reader_options.export_timeout_millis  = std::chrono::milliseconds(otlp_config.metrics_interval_ms / 2);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(),
                                                           resource::Resource::Create({{"service.name", otlp_config.service_name}}));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("ingest-manager", "0.1.0");

  impl_->upload_count        = impl_->meter->CreateUInt64Counter("ingest.upload.count", "Submitted uploads by outcome", "1");
  impl_->job_count           = impl_->meter->CreateUInt64Counter("ingest.job.count", "Executed jobs by queue, kind and outcome", "1");
  impl_->provider_latency_ms = impl_->meter->CreateDoubleHistogram("ingest.provider.latency_ms", "Storage provider call latency", "ms");
  impl_->queue_depth_gauge   = impl_->meter->CreateInt64ObservableGauge("ingest.queue.depth", "Waiting plus delayed jobs", "1");
  impl_->queue_depth_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->queue_depth_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [queue, depth] : impl->queue_depth_values) {
          const std::initializer_list<AttributePair> attributes = {{"queue", queue}};
          int_result->Observe(depth, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordUpload(std::string_view outcome) {
  if (!impl_ || !impl_->upload_count) return;
  const std::string                          outcome_value(outcome);
  const std::initializer_list<AttributePair> attributes = {{"outcome", outcome_value}};
  impl_->upload_count->Add(1, attributes);
}

void Metrics::RecordJob(std::string_view queue, std::string_view kind, std::string_view outcome) {
  if (!impl_ || !impl_->job_count) return;
  const std::string                          queue_value(queue);
  const std::string                          kind_value(kind);
  const std::string                          outcome_value(outcome);
  const std::initializer_list<AttributePair> attributes = {{"queue", queue_value}, {"kind", kind_value}, {"outcome", outcome_value}};
  impl_->job_count->Add(1, attributes);
}

void Metrics::ObserveProviderLatencyMs(std::string_view provider, std::string_view op, double latency_ms) {
  if (!impl_ || !impl_->provider_latency_ms) return;
  const std::string                          provider_value(provider);
  const std::string                          op_value(op);
  const std::initializer_list<AttributePair> attributes = {{"provider", provider_value}, {"op", op_value}};
  impl_->provider_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::SetQueueDepth(std::string_view queue, std::uint64_t depth) {
  if (!impl_ || !impl_->queue_depth_gauge) return;
  std::lock_guard<std::mutex> lock(impl_->queue_depth_mutex);
  impl_->queue_depth_values[std::string(queue)] = static_cast<std::int64_t>(depth);
}

} // namespace ingest::observability

#endif
