#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace meshdispatch::runtime::config {
class RuntimeConfig;
}

namespace meshdispatch::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"mesh-dispatch"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeMetrics(const meshdispatch::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // Radio path
  void RecordInboundDropped();
  void RecordMalformedFrame();
  void RecordRetransmit(std::string_view kind);
  void RecordAckExhausted(std::string_view kind);
  void RecordUnitOffline();

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

inline bool InitializeMetrics(const meshdispatch::runtime::config::RuntimeConfig&) {
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

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordInboundDropped() {
}

inline void Metrics::RecordMalformedFrame() {
}

inline void Metrics::RecordRetransmit(std::string_view) {
}

inline void Metrics::RecordAckExhausted(std::string_view) {
}

inline void Metrics::RecordUnitOffline() {
}
#endif

} // namespace meshdispatch::observability
