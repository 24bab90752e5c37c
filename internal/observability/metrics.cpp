#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define TSBATCH_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define TSBATCH_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace tsbatch::observability {
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

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  return resource::Resource::Create(attrs);
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value>
void RecordPlain(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value) {
  if constexpr (requires { instrument->Record(value, opentelemetry::context::Context{}); }) {
    instrument->Record(value, opentelemetry::context::Context{});
  } else {
    instrument->Record(value);
  }
}

bool InstallProvider(const OtlpConfig& config, std::chrono::milliseconds interval, std::chrono::milliseconds timeout) {
  auto endpoint = ResolveEndpoint(config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = interval;
  if (timeout.count() > 0) {
    reader_options.export_timeout_millis = timeout;
  }
#ifdef TSBATCH_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto resource = BuildResource(config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> records_enqueued;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      staged_batch_records;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> upload_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      upload_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   buffer_depth_gauge;

  std::atomic<std::int64_t> buffer_depth{0};
};

bool InitializeMetrics(const OtlpConfig& config) {
  return InstallProvider(config, std::chrono::milliseconds(1000), std::chrono::milliseconds(0));
}

bool InitializeMetrics(const tsbatch::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == tsbatch::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  const auto& metric_config = observability.metrics();
  const auto  interval_ms   = metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000;

  return InstallProvider(otlp_config, std::chrono::milliseconds(interval_ms), std::chrono::milliseconds(metric_config.export_timeout_ms()));
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
  impl_->meter  = provider->GetMeter("tsbatch", "0.1.0");

  impl_->request_count        = impl_->meter->CreateUInt64Counter("tsbatch.request.count", "1", "Total number of intake requests");
  impl_->records_enqueued     = impl_->meter->CreateUInt64Counter("tsbatch.records.enqueued", "1", "Time series accepted into the intake buffer");
  impl_->staged_batch_records = impl_->meter->CreateDoubleHistogram("tsbatch.staging.batch_records", "1", "Records per staged file");
  impl_->upload_outcomes      = impl_->meter->CreateUInt64Counter("tsbatch.upload.outcome", "1", "Terminal outcomes of staged file uploads");
  impl_->upload_duration_ms   = impl_->meter->CreateDoubleHistogram("tsbatch.upload.duration_ms", "ms", "Duration of a single bulk load attempt");
  impl_->buffer_depth_gauge   = impl_->meter->CreateInt64ObservableGauge("tsbatch.buffer.depth", "Records waiting in the intake buffer", "1");
  impl_->buffer_depth_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->buffer_depth.load(std::memory_order_relaxed));
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  const std::string                          route_value(route);
  const std::initializer_list<AttributePair> attributes = {{"route", route_value}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::AddRecordsEnqueued(std::uint64_t count) {
  if (!impl_ || !impl_->records_enqueued) {
    return;
  }
  AddWithAttributes(impl_->records_enqueued, count, std::initializer_list<AttributePair>{});
}

void Metrics::ObserveStagedBatchRecords(std::uint64_t records) {
  if (!impl_ || !impl_->staged_batch_records) {
    return;
  }
  RecordPlain(impl_->staged_batch_records, static_cast<double>(records));
}

void Metrics::RecordUploadOutcome(std::string_view outcome) {
  if (!impl_ || !impl_->upload_outcomes) {
    return;
  }

  const std::string                          outcome_value(outcome);
  const std::initializer_list<AttributePair> attributes = {{"outcome", outcome_value}};
  AddWithAttributes(impl_->upload_outcomes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveUploadDurationMs(double duration_ms) {
  if (!impl_ || !impl_->upload_duration_ms) {
    return;
  }
  RecordPlain(impl_->upload_duration_ms, duration_ms);
}

void Metrics::SetBufferDepth(std::uint64_t records) {
  if (!impl_) {
    return;
  }
  impl_->buffer_depth.store(static_cast<std::int64_t>(records), std::memory_order_relaxed);
}

} // namespace tsbatch::observability

#endif
