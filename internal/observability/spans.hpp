#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace seawatch::runtime::config {
class RuntimeConfig;
}

namespace seawatch::observability {

bool InitializeTracing(const seawatch::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const seawatch::runtime::config::RuntimeConfig& config);
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
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Dedup engine metrics.

  pairs:   every cross-source pair the orchestrator scored, labelled by
           confidence band (none / medium / high)
  merges:  merge outcomes (succeeded / conflict / failed)
  matches: ingest-time candidate lookups (matched / no_match)
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordPairScored(std::string_view band);
  void RecordMergeOutcome(std::string_view outcome);
  void RecordMatchOutcome(bool matched);
  void ObservePassDurationMs(double duration_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const seawatch::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const seawatch::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::SetAttribute(std::string_view, double) {
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

inline void Metrics::RecordPairScored(std::string_view) {
}

inline void Metrics::RecordMergeOutcome(std::string_view) {
}

inline void Metrics::RecordMatchOutcome(bool) {
}

inline void Metrics::ObservePassDurationMs(double) {
}
#endif

} // namespace seawatch::observability
