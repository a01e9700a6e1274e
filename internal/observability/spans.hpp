#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace ingest::runtime::config {
class RuntimeConfig;
}

namespace ingest::observability {

/*
  Tracing and metrics facade.

  Built with ENABLE_OTEL the calls export over OTLP; otherwise every
  call below is an inline no-op so call sites never need #ifdefs.
*/

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"ingest-manager"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t metrics_interval_ms{1000};
};

OtlpConfig ToOtlpConfig(const ingest::runtime::config::RuntimeConfig& config);

bool InitializeTracing(const ingest::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const ingest::runtime::config::RuntimeConfig& config);
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
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // outcome: accepted | deduplicated | rejected
  void RecordUpload(std::string_view outcome);
  // outcome: completed | retried | failed
  void RecordJob(std::string_view queue, std::string_view kind, std::string_view outcome);
  void ObserveProviderLatencyMs(std::string_view provider, std::string_view op, double latency_ms);
  void SetQueueDepth(std::string_view queue, std::uint64_t depth);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline OtlpConfig ToOtlpConfig(const ingest::runtime::config::RuntimeConfig&) {
  return {};
}

inline bool InitializeTracing(const ingest::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const ingest::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordUpload(std::string_view) {
}

inline void Metrics::RecordJob(std::string_view, std::string_view, std::string_view) {
}

inline void Metrics::ObserveProviderLatencyMs(std::string_view, std::string_view, double) {
}

inline void Metrics::SetQueueDepth(std::string_view, std::uint64_t) {
}
#endif

} // namespace ingest::observability
