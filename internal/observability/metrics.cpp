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
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <utility>

#include "config/config.pb.h"

namespace seawatch::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const seawatch::runtime::config::ObservabilityConfig& observability, bool http) {
  if (!observability.otlp_endpoint().empty()) {
    return observability.otlp_endpoint();
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }
  return http ? "http://localhost:4318/v1/metrics" : "localhost:4317";
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
void RecordValue(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value) {
  if constexpr (requires { instrument->Record(value, opentelemetry::context::Context{}); }) {
    instrument->Record(value, opentelemetry::context::Context{});
  } else {
    instrument->Record(value);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> pairs_scored;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> merge_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> match_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      pass_duration_ms;
};

bool InitializeMetrics(const seawatch::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const bool http     = observability.transport() == seawatch::runtime::config::OTLP_TRANSPORT_HTTP;
  const auto endpoint = ResolveEndpoint(observability, http);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint = endpoint;
    exporter         = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  // A dedup pass is short lived; export often so nothing is lost at exit.
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create({{"service.name", "seawatch-dedup"}}));
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
  impl_->meter  = provider->GetMeter("seawatch-dedup", "0.1.0");

  impl_->pairs_scored     = impl_->meter->CreateUInt64Counter("seawatch.dedup.pairs_scored", "Cross-source pairs scored", "1");
  impl_->merge_outcomes   = impl_->meter->CreateUInt64Counter("seawatch.dedup.merges", "Merge attempts by outcome", "1");
  impl_->match_outcomes   = impl_->meter->CreateUInt64Counter("seawatch.matcher.lookups", "Ingest-time candidate lookups", "1");
  impl_->pass_duration_ms = impl_->meter->CreateDoubleHistogram("seawatch.dedup.pass_duration_ms", "Dedup pass duration", "ms");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordPairScored(std::string_view band) {
  if (!impl_ || !impl_->pairs_scored) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"band", std::string(band)}};
  AddWithAttributes(impl_->pairs_scored, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordMergeOutcome(std::string_view outcome) {
  if (!impl_ || !impl_->merge_outcomes) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->merge_outcomes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordMatchOutcome(bool matched) {
  if (!impl_ || !impl_->match_outcomes) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"matched", matched}};
  AddWithAttributes(impl_->match_outcomes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObservePassDurationMs(double duration_ms) {
  if (!impl_ || !impl_->pass_duration_ms) {
    return;
  }
  RecordValue(impl_->pass_duration_ms, duration_ms);
}

} // namespace seawatch::observability

#endif
