#pragma once

#include <mise/image.hpp>

#include <cstdint>
#include <string>

namespace mise::server {

/**
 * Listener configuration.
 */
struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 8080;
  uint32_t threads = 0;  // 0 = auto-detect CPU cores
  std::string log_level = "info";
};

/**
 * Metrics configuration.
 */
struct MetricsConfig {
  bool enabled = true;
  std::string path = "/metrics";
};

/**
 * Complete server configuration.
 *
 * File format (indented sections, '#' comments):
 *   server:
 *     host: 127.0.0.1
 *     port: 8080
 *   metrics:
 *     enabled: true
 *   images:
 *     bucket: my-recipes
 *     region: eu-west-1
 */
struct Config {
  ServerConfig server;
  MetricsConfig metrics;
  ImageOptions images;

  /**
   * Load configuration from a YAML-style file.
   * @throws std::runtime_error if file cannot be read or a value is invalid.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse configuration from command-line arguments.
   * A --config file is loaded first; other flags override it.
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;
};

}  // namespace mise::server
