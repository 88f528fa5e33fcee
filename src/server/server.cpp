#include <mise/server/server.hpp>
#include <mise/server/handlers.hpp>

#include <drogon/drogon.h>

#include <thread>

namespace mise::server {

namespace {

trantor::Logger::LogLevel ToLogLevel(const std::string& level) {
  if (level == "debug") return trantor::Logger::kDebug;
  if (level == "warn") return trantor::Logger::kWarn;
  if (level == "error") return trantor::Logger::kError;
  return trantor::Logger::kInfo;
}

}  // namespace

Server::Server(const Config& config, std::unique_ptr<ImageFetcher> fetcher,
               std::unique_ptr<BlobStore> store)
    : config_(config), fetcher_(std::move(fetcher)), store_(std::move(store)) {
  config_.Validate();

  images_ = ImageResolver(config_.images, fetcher_.get(), store_.get());
  normalizer_ = RecipeNormalizer(&images_);

  if (config_.metrics.enabled) {
    metrics_ = std::make_shared<PrometheusMetrics>();
  }
}

Server::~Server() {
  if (running_) {
    Shutdown();
  }
}

void Server::SetupRoutes() {
  RegisterHandlers(&normalizer_, config_, metrics_);

  if (metrics_) {
    RegisterMetricsHandler(metrics_, config_.metrics.path);
  }
}

void Server::Run() {
  running_ = true;

  auto& app = drogon::app();
  app.setLogLevel(ToLogLevel(config_.server.log_level));
  app.addListener(config_.server.host, config_.server.port);

  uint32_t threads = config_.server.threads;
  if (threads == 0) {
    threads = std::thread::hardware_concurrency();
    if (threads == 0) threads = 4;  // Fallback
  }
  app.setThreadNum(threads);

  app.setMaxConnectionNum(10000);
  app.setMaxConnectionNumPerIP(100);
  app.setIdleConnectionTimeout(60);
  app.setKeepaliveRequestsNumber(100);
  app.setClientMaxBodySize(1024 * 1024);

  // Stateless API, no sessions
  app.disableSession();

  SetupRoutes();

  app.setTermSignalHandler([]() {
    LOG_INFO << "Shutting down HTTP server...";
    drogon::app().quit();
  });
  app.setIntSignalHandler([]() {
    LOG_INFO << "Interrupted, shutting down HTTP server...";
    drogon::app().quit();
  });

  LOG_INFO << "Mise server starting on " << config_.server.host << ":"
           << config_.server.port << " with " << threads << " threads";
  if (images_.enabled()) {
    LOG_INFO << "Image re-hosting enabled, bucket: " << config_.images.bucket;
  } else if (!config_.images.bucket.empty()) {
    LOG_WARN << "images.bucket is set to " << config_.images.bucket
             << " but no image fetcher or blob store was supplied; "
             << "image URLs are passed through unchanged";
  }

  // Run Drogon (blocking)
  app.run();

  running_ = false;
  LOG_INFO << "Server stopped.";
}

void Server::Shutdown() {
  if (running_) {
    drogon::app().quit();
  }
}

}  // namespace mise::server
