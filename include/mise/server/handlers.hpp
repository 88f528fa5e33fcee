#pragma once

#include <mise/recipe.hpp>
#include <mise/server/config.hpp>
#include <mise/server/metrics.hpp>

#include <drogon/HttpAppFramework.h>
#include <json/json.h>

#include <memory>
#include <string>

namespace mise::server {

/**
 * Build a JSON response with the given status.
 */
drogon::HttpResponsePtr MakeJsonResponse(const Json::Value& json,
                                         drogon::HttpStatusCode code);

/**
 * Build an error response in the service's error shape:
 *   {"success": false, "message": ..., "error_type": ...}
 */
drogon::HttpResponsePtr MakeErrorResponse(const std::string& message,
                                          const std::string& error_type,
                                          drogon::HttpStatusCode code);

/**
 * Register the health, normalization and recipe handlers with the Drogon app.
 * normalizer must outlive the app; metrics may be null.
 */
void RegisterHandlers(const RecipeNormalizer* normalizer, const Config& config,
                      std::shared_ptr<PrometheusMetrics> metrics);

}  // namespace mise::server
