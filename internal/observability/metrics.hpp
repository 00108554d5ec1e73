#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace healthd::runtime::config {
class RuntimeConfig;
}

namespace healthd::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"healthd"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeMetrics(const healthd::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Storage latency sink. Every observation is a no-op unless the build has
  ENABLE_OTEL and InitializeMetrics() installed a meter provider.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void ObserveInsertUpdateSeconds(std::string_view table, double seconds);
  void ObserveSelectSeconds(std::string_view table, double seconds);
  void ObserveDeleteSeconds(std::string_view table, double seconds);

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

inline bool InitializeMetrics(const healthd::runtime::config::RuntimeConfig&) {
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

inline void Metrics::ObserveInsertUpdateSeconds(std::string_view, double) {
}

inline void Metrics::ObserveSelectSeconds(std::string_view, double) {
}

inline void Metrics::ObserveDeleteSeconds(std::string_view, double) {
}
#endif

} // namespace healthd::observability
