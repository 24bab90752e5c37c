#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace tsbatch::runtime::config {
class RuntimeConfig;
}

namespace tsbatch::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"tsbatch"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeMetrics(const tsbatch::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void AddRecordsEnqueued(std::uint64_t count);
  void ObserveStagedBatchRecords(std::uint64_t records);
  void RecordUploadOutcome(std::string_view outcome);
  void ObserveUploadDurationMs(double duration_ms);
  void SetBufferDepth(std::uint64_t records);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const tsbatch::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::AddRecordsEnqueued(std::uint64_t) {
}

inline void Metrics::ObserveStagedBatchRecords(std::uint64_t) {
}

inline void Metrics::RecordUploadOutcome(std::string_view) {
}

inline void Metrics::ObserveUploadDurationMs(double) {
}

inline void Metrics::SetBufferDepth(std::uint64_t) {
}
#endif

} // namespace tsbatch::observability
