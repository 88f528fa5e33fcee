#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <tuple>

namespace mise::server {

/** What happened to a recipe's image. */
enum class ImageOutcome {
  kUploaded,     // re-hosted, key set
  kPassthrough,  // re-hosting off, original URL kept
  kFallback,     // re-hosting failed, original URL kept
};

/**
 * Prometheus registry for the service.
 *
 * Exported families:
 *   mise_http_requests_total{method,path,status}
 *   mise_http_request_duration_ms{path}          histogram
 *   mise_normalizations_total{kind}
 *   mise_normalizations_unparsed_total{kind}     calls that returned 0
 *   mise_images_total{outcome}
 *
 * Thread-safe.
 */
class PrometheusMetrics {
 public:
  PrometheusMetrics() = default;

  void RecordHttpRequest(const std::string& method,
                         const std::string& path,
                         int status_code,
                         double latency_ms);

  /**
   * Count one normalizer call. kind is "duration", "servings", "platform"
   * or "recipe"; unparsed marks a call whose input yielded nothing.
   */
  void RecordNormalization(std::string_view kind, bool unparsed = false);

  void RecordImage(ImageOutcome outcome);

  /** Prometheus text exposition format, families in a stable order. */
  std::string Export() const;

 private:
  static constexpr std::array<double, 14> kLatencyBucketsMs = {
      0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 25, 50, 100, 250, 500, 1000};

  struct LatencyHistogram {
    std::array<uint64_t, kLatencyBucketsMs.size() + 1> cumulative{};
    uint64_t count = 0;
    double sum = 0.0;

    void Observe(double ms);
    void Write(std::ostream& out, const std::string& path) const;
  };

  struct KindCounts {
    uint64_t calls = 0;
    uint64_t unparsed = 0;
  };

  mutable std::mutex mu_;
  std::map<std::tuple<std::string, std::string, int>, uint64_t> http_requests_;
  std::map<std::string, LatencyHistogram> http_latency_;
  std::map<std::string, KindCounts, std::less<>> normalizations_;
  std::array<uint64_t, 3> images_{};
};

/**
 * Register the metrics endpoint with the Drogon app.
 */
void RegisterMetricsHandler(std::shared_ptr<PrometheusMetrics> metrics,
                            const std::string& path);

/**
 * RAII helper for timing HTTP requests. A null metrics pointer disables it.
 */
class RequestTimer {
 public:
  RequestTimer(std::shared_ptr<PrometheusMetrics> metrics,
               std::string method,
               std::string path);

  ~RequestTimer();

  void SetStatusCode(int code) { status_code_ = code; }

 private:
  std::shared_ptr<PrometheusMetrics> metrics_;
  std::string method_;
  std::string path_;
  int status_code_ = 200;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace mise::server
