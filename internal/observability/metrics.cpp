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

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "config/config.pb.h"

namespace taskorch::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

struct MetricsOptions {
  std::uint32_t collection_interval_ms{1000};
  std::uint32_t export_timeout_ms{0};
};

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

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

bool InstallProvider(const OtlpConfig& config, const MetricsOptions& metric_options) {
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
  reader_options.export_interval_millis = std::chrono::milliseconds(metric_options.collection_interval_ms);
  if (metric_options.export_timeout_ms > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_options.export_timeout_ms);
  }
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  auto resource = BuildResource(config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> task_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      task_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> broadcasts;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> breaker_transitions;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> handler_failures;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   queue_depth_gauge;

  std::mutex                                    queue_depth_mutex;
  std::unordered_map<std::string, std::int64_t> queue_depth_values;
};

bool InitializeMetrics(const OtlpConfig& config) {
  return InstallProvider(config, MetricsOptions{});
}

bool InitializeMetrics(const taskorch::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == taskorch::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  MetricsOptions metric_options;
  if (observability.collection_interval_ms() > 0) {
    metric_options.collection_interval_ms = observability.collection_interval_ms();
  }
  metric_options.export_timeout_ms = observability.export_timeout_ms();

  return InstallProvider(otlp_config, metric_options);
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
  impl_->meter  = provider->GetMeter("taskorch", "0.1.0");

  impl_->task_outcomes       = impl_->meter->CreateUInt64Counter("taskorch.task.outcomes", "Finished task attempts by outcome", "1");
  impl_->task_duration_ms    = impl_->meter->CreateDoubleHistogram("taskorch.task.duration_ms", "Executor wall time per attempt", "ms");
  impl_->broadcasts          = impl_->meter->CreateUInt64Counter("taskorch.broadcast.count", "Status broadcasts by result", "1");
  impl_->breaker_transitions = impl_->meter->CreateUInt64Counter("taskorch.broadcast.breaker_transitions", "Circuit breaker phase changes", "1");
  impl_->handler_failures    = impl_->meter->CreateUInt64Counter("taskorch.events.handler_failures", "Event handlers that threw", "1");
  impl_->queue_depth_gauge   = impl_->meter->CreateInt64ObservableGauge("taskorch.queue.pending", "Pending tasks per queue", "1");
  impl_->queue_depth_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->queue_depth_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [queue, pending] : impl->queue_depth_values) {
          const std::initializer_list<AttributePair> attributes = {{"queue", queue}};
          int_result->Observe(pending, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordTaskOutcome(std::string_view queue, std::string_view outcome) {
  if (!impl_ || !impl_->task_outcomes) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"queue", std::string(queue)}, {"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->task_outcomes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveTaskDurationMs(std::string_view queue, double duration_ms) {
  if (!impl_ || !impl_->task_duration_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"queue", std::string(queue)}};
  RecordWithAttributes(impl_->task_duration_ms, duration_ms, attributes);
}

void Metrics::SetQueueDepth(std::string_view queue, std::uint64_t pending) {
  if (!impl_ || !impl_->queue_depth_gauge) {
    return;
  }
  std::lock_guard<std::mutex> lock(impl_->queue_depth_mutex);
  impl_->queue_depth_values[std::string(queue)] = static_cast<std::int64_t>(pending);
}

void Metrics::RecordBroadcast(std::string_view result) {
  if (!impl_ || !impl_->broadcasts) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"result", std::string(result)}};
  AddWithAttributes(impl_->broadcasts, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordBreakerTransition(std::string_view phase) {
  if (!impl_ || !impl_->breaker_transitions) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"phase", std::string(phase)}};
  AddWithAttributes(impl_->breaker_transitions, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordHandlerFailure(std::string_view event_type) {
  if (!impl_ || !impl_->handler_failures) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"event_type", std::string(event_type)}};
  AddWithAttributes(impl_->handler_failures, static_cast<std::uint64_t>(1), attributes);
}

} // namespace taskorch::observability

#endif
