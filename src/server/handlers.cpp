#include <mise/server/handlers.hpp>

#include <mise/duration.hpp>
#include <mise/internal.hpp>
#include <mise/json.hpp>
#include <mise/platform.hpp>
#include <mise/servings.hpp>
#include <mise/version.hpp>

#include <drogon/drogon.h>

#include <exception>

namespace mise::server {

namespace {

using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

// Body as JSON: Drogon's parsed object when the content type says JSON,
// otherwise a manual parse of the raw body.
bool ReadJsonBody(const drogon::HttpRequestPtr& req, Json::Value* out,
                  std::string* error_out) {
  if (auto json = req->getJsonObject()) {
    *out = *json;
    return true;
  }
  std::string body(req->body());
  if (body.empty()) {
    *error_out = "Request body must be JSON";
    return false;
  }
  std::string parse_error;
  if (!ParseJson(body, out, &parse_error)) {
    *error_out = "Invalid JSON body: " + parse_error;
    return false;
  }
  return true;
}

void Record(const std::shared_ptr<PrometheusMetrics>& metrics, const char* kind,
            bool unparsed) {
  if (metrics) metrics->RecordNormalization(kind, unparsed);
}

ImageOutcome OutcomeOf(const Recipe& recipe, const std::string& image_error) {
  if (!image_error.empty()) return ImageOutcome::kFallback;
  if (!recipe.image.key.empty()) return ImageOutcome::kUploaded;
  return ImageOutcome::kPassthrough;
}

}  // namespace

drogon::HttpResponsePtr MakeJsonResponse(const Json::Value& json,
                                         drogon::HttpStatusCode code) {
  auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
  resp->setStatusCode(code);
  return resp;
}

drogon::HttpResponsePtr MakeErrorResponse(const std::string& message,
                                          const std::string& error_type,
                                          drogon::HttpStatusCode code) {
  return MakeJsonResponse(ErrorJson(message, error_type), code);
}

void RegisterHandlers(const RecipeNormalizer* normalizer, const Config& config,
                      std::shared_ptr<PrometheusMetrics> metrics) {
  auto& app = drogon::app();

  // ==========================================================================
  // Health
  // ==========================================================================

  Json::Value endpoints;
  endpoints["health"] = "GET /health";
  endpoints["normalize"] = "POST /api/v1/normalize";
  endpoints["duration"] = "GET /api/v1/normalize/duration?value=";
  endpoints["servings"] = "GET /api/v1/normalize/servings?value=";
  endpoints["platform"] = "GET /api/v1/platform?url=";
  endpoints["recipe"] = "POST /api/v1/recipes/normalize";
  if (config.metrics.enabled) {
    endpoints["metrics"] = "GET " + config.metrics.path;
  }

  // GET /health - Liveness check
  app.registerHandler(
      "/health",
      [endpoints, metrics](const drogon::HttpRequestPtr&, Callback&& callback) {
        RequestTimer timer(metrics, "GET", "/health");

        Json::Value json;
        json["status"] = "healthy";
        json["timestamp"] = static_cast<double>(internal::WallClockMillis()) / 1000.0;
        json["version"] = Version();
        json["endpoints"] = endpoints;
        callback(MakeJsonResponse(json, drogon::k200OK));
      },
      {drogon::Get});

  // ==========================================================================
  // Field normalization
  // ==========================================================================

  // POST /api/v1/normalize - any of {"duration", "servings", "url"}
  app.registerHandler(
      "/api/v1/normalize",
      [metrics](const drogon::HttpRequestPtr& req, Callback&& callback) {
        RequestTimer timer(metrics, "POST", "/api/v1/normalize");

        Json::Value body;
        std::string error;
        if (!ReadJsonBody(req, &body, &error) || !body.isObject()) {
          timer.SetStatusCode(400);
          callback(MakeErrorResponse(
              error.empty() ? "Request body must be a JSON object" : error,
              "invalid_argument", drogon::k400BadRequest));
          return;
        }

        Json::Value json;
        if (body.isMember("duration")) {
          int64_t minutes = NormalizeDuration(FieldValueFromJson(body["duration"]));
          json["minutes"] = static_cast<Json::Int64>(minutes);
          Record(metrics, "duration", minutes == 0);
        }
        if (body.isMember("servings")) {
          int64_t servings = NormalizeServings(FieldValueFromJson(body["servings"]));
          json["servings"] = static_cast<Json::Int64>(servings);
          Record(metrics, "servings", servings == 0);
        }
        if (body.isMember("url")) {
          const Json::Value& url = body["url"];
          std::string text = url.isString() ? url.asString() : "";
          json["platform"] = PlatformName(ClassifyPlatform(text));
          Record(metrics, "platform", text.empty());
        }
        callback(MakeJsonResponse(json, drogon::k200OK));
      },
      {drogon::Post});

  // GET /api/v1/normalize/duration?value=1h30m
  app.registerHandler(
      "/api/v1/normalize/duration",
      [metrics](const drogon::HttpRequestPtr& req, Callback&& callback) {
        RequestTimer timer(metrics, "GET", "/api/v1/normalize/duration");
        std::string value = req->getParameter("value");

        int64_t minutes = NormalizeDuration(value);
        Json::Value json;
        json["value"] = value;
        json["minutes"] = static_cast<Json::Int64>(minutes);
        Record(metrics, "duration", minutes == 0);
        callback(MakeJsonResponse(json, drogon::k200OK));
      },
      {drogon::Get});

  // GET /api/v1/normalize/servings?value=4-6
  app.registerHandler(
      "/api/v1/normalize/servings",
      [metrics](const drogon::HttpRequestPtr& req, Callback&& callback) {
        RequestTimer timer(metrics, "GET", "/api/v1/normalize/servings");
        std::string value = req->getParameter("value");

        int64_t servings = NormalizeServings(value);
        Json::Value json;
        json["value"] = value;
        json["servings"] = static_cast<Json::Int64>(servings);
        Record(metrics, "servings", servings == 0);
        callback(MakeJsonResponse(json, drogon::k200OK));
      },
      {drogon::Get});

  // GET /api/v1/platform?url=https://youtu.be/...
  app.registerHandler(
      "/api/v1/platform",
      [metrics](const drogon::HttpRequestPtr& req, Callback&& callback) {
        RequestTimer timer(metrics, "GET", "/api/v1/platform");
        std::string url = req->getParameter("url");

        Json::Value json;
        json["url"] = url;
        json["platform"] = PlatformName(ClassifyPlatform(url));
        Record(metrics, "platform", url.empty());
        callback(MakeJsonResponse(json, drogon::k200OK));
      },
      {drogon::Get});

  // ==========================================================================
  // Recipes
  // ==========================================================================

  // POST /api/v1/recipes/normalize - raw extracted fields in, canonical out
  app.registerHandler(
      "/api/v1/recipes/normalize",
      [normalizer, metrics](const drogon::HttpRequestPtr& req, Callback&& callback) {
        RequestTimer timer(metrics, "POST", "/api/v1/recipes/normalize");
        const uint64_t start_us = internal::NowMicros();

        Json::Value body;
        RawRecipe raw;
        std::string error;
        if (!ReadJsonBody(req, &body, &error) ||
            !RawRecipeFromJson(body, &raw, &error)) {
          timer.SetStatusCode(400);
          callback(MakeErrorResponse(error, "invalid_argument",
                                     drogon::k400BadRequest));
          return;
        }

        try {
          std::string image_error;
          Recipe recipe = normalizer->Normalize(raw, &image_error);
          Record(metrics, "recipe", recipe.total_time == 0 && recipe.yields == 0);
          if (!image_error.empty()) {
            LOG_WARN << "Keeping original image for " << raw.url << ": "
                     << image_error;
          }
          if (metrics && !recipe.image.url.empty()) {
            metrics->RecordImage(OutcomeOf(recipe, image_error));
          }

          Json::Value json;
          json["success"] = true;
          json["source"] = raw.source.empty() ? "unknown" : raw.source;
          json["processing_time"] =
              static_cast<double>(internal::NowMicros() - start_us) / 1e6;
          json["data"] = RecipeToJson(recipe);
          LOG_DEBUG << "Normalized recipe " << recipe.url << " ("
                    << PlatformName(recipe.platform) << ")";
          callback(MakeJsonResponse(json, drogon::k200OK));
        } catch (const std::exception& e) {
          LOG_ERROR << "Recipe normalization failed for " << raw.url << ": "
                    << e.what();
          timer.SetStatusCode(500);
          callback(MakeErrorResponse(e.what(), "internal_error",
                                     drogon::k500InternalServerError));
        }
      },
      {drogon::Post});
}

}  // namespace mise::server
