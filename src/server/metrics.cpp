#include <mise/server/metrics.hpp>

#include <drogon/drogon.h>

#include <sstream>

namespace mise::server {

namespace {

const char* OutcomeLabel(size_t index) {
  switch (static_cast<ImageOutcome>(index)) {
    case ImageOutcome::kUploaded:
      return "uploaded";
    case ImageOutcome::kPassthrough:
      return "passthrough";
    case ImageOutcome::kFallback:
      return "fallback";
  }
  return "unknown";
}

}  // namespace

void PrometheusMetrics::LatencyHistogram::Observe(double ms) {
  for (size_t i = 0; i < kLatencyBucketsMs.size(); ++i) {
    if (ms <= kLatencyBucketsMs[i]) ++cumulative[i];
  }
  ++cumulative.back();  // +Inf
  ++count;
  sum += ms;
}

void PrometheusMetrics::LatencyHistogram::Write(std::ostream& out,
                                                const std::string& path) const {
  const char* name = "mise_http_request_duration_ms";
  for (size_t i = 0; i < kLatencyBucketsMs.size(); ++i) {
    out << name << "_bucket{path=\"" << path << "\",le=\"" << kLatencyBucketsMs[i]
        << "\"} " << cumulative[i] << "\n";
  }
  out << name << "_bucket{path=\"" << path << "\",le=\"+Inf\"} " << cumulative.back()
      << "\n";
  out << name << "_sum{path=\"" << path << "\"} " << sum << "\n";
  out << name << "_count{path=\"" << path << "\"} " << count << "\n";
}

void PrometheusMetrics::RecordHttpRequest(const std::string& method,
                                          const std::string& path,
                                          int status_code,
                                          double latency_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  ++http_requests_[std::make_tuple(method, path, status_code)];
  http_latency_[path].Observe(latency_ms);
}

void PrometheusMetrics::RecordNormalization(std::string_view kind, bool unparsed) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = normalizations_.find(kind);
  if (it == normalizations_.end()) {
    it = normalizations_.emplace(std::string(kind), KindCounts{}).first;
  }
  ++it->second.calls;
  if (unparsed) ++it->second.unparsed;
}

void PrometheusMetrics::RecordImage(ImageOutcome outcome) {
  std::lock_guard<std::mutex> lock(mu_);
  ++images_[static_cast<size_t>(outcome)];
}

std::string PrometheusMetrics::Export() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream out;

  if (!http_requests_.empty()) {
    out << "# TYPE mise_http_requests_total counter\n";
    for (const auto& [key, count] : http_requests_) {
      const auto& [method, path, status] = key;
      out << "mise_http_requests_total{method=\"" << method << "\",path=\"" << path
          << "\",status=\"" << status << "\"} " << count << "\n";
    }

    out << "# TYPE mise_http_request_duration_ms histogram\n";
    for (const auto& [path, histogram] : http_latency_) {
      histogram.Write(out, path);
    }
  }

  if (!normalizations_.empty()) {
    out << "# TYPE mise_normalizations_total counter\n";
    for (const auto& [kind, counts] : normalizations_) {
      out << "mise_normalizations_total{kind=\"" << kind << "\"} " << counts.calls
          << "\n";
    }
    out << "# TYPE mise_normalizations_unparsed_total counter\n";
    for (const auto& [kind, counts] : normalizations_) {
      out << "mise_normalizations_unparsed_total{kind=\"" << kind << "\"} "
          << counts.unparsed << "\n";
    }
  }

  out << "# TYPE mise_images_total counter\n";
  for (size_t i = 0; i < images_.size(); ++i) {
    out << "mise_images_total{outcome=\"" << OutcomeLabel(i) << "\"} " << images_[i]
        << "\n";
  }

  return out.str();
}

void RegisterMetricsHandler(std::shared_ptr<PrometheusMetrics> metrics,
                            const std::string& path) {
  drogon::app().registerHandler(
      path,
      [metrics](const drogon::HttpRequestPtr&,
                std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setBody(metrics->Export());
        resp->setContentTypeString("text/plain; version=0.0.4; charset=utf-8");
        resp->setStatusCode(drogon::k200OK);
        callback(resp);
      },
      {drogon::Get});
}

RequestTimer::RequestTimer(std::shared_ptr<PrometheusMetrics> metrics,
                           std::string method,
                           std::string path)
    : metrics_(std::move(metrics)),
      method_(std::move(method)),
      path_(std::move(path)),
      start_(std::chrono::steady_clock::now()) {}

RequestTimer::~RequestTimer() {
  if (!metrics_) return;
  std::chrono::duration<double, std::milli> elapsed =
      std::chrono::steady_clock::now() - start_;
  metrics_->RecordHttpRequest(method_, path_, status_code_, elapsed.count());
}

}  // namespace mise::server
