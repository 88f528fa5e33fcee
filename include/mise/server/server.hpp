#pragma once

#include <mise/image.hpp>
#include <mise/recipe.hpp>
#include <mise/server/config.hpp>
#include <mise/server/metrics.hpp>

#include <memory>

namespace mise::server {

/**
 * Mise HTTP Server.
 *
 * Exposes the field normalizers and the recipe assembler as a REST API
 * using Drogon. Image re-hosting is active only when the embedding
 * application supplies both collaborators and images.bucket is configured.
 */
class Server {
 public:
  /**
   * Create a server with the given configuration.
   * @throws std::runtime_error if the configuration is invalid.
   */
  explicit Server(const Config& config,
                  std::unique_ptr<ImageFetcher> fetcher = nullptr,
                  std::unique_ptr<BlobStore> store = nullptr);

  ~Server();

  // Non-copyable, non-movable
  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  /**
   * Start the server (blocking).
   * Returns when the server shuts down (SIGINT/SIGTERM or Shutdown()).
   */
  void Run();

  /**
   * Request shutdown (async).
   */
  void Shutdown();

  const RecipeNormalizer& normalizer() const { return normalizer_; }
  const ImageResolver& images() const { return images_; }
  std::shared_ptr<PrometheusMetrics> metrics() const { return metrics_; }

 private:
  void SetupRoutes();

  Config config_;
  std::unique_ptr<ImageFetcher> fetcher_;
  std::unique_ptr<BlobStore> store_;
  ImageResolver images_;
  RecipeNormalizer normalizer_;
  std::shared_ptr<PrometheusMetrics> metrics_;
  bool running_ = false;
};

}  // namespace mise::server
