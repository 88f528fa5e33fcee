#include <mise/server/config.hpp>
#include <mise/internal.hpp>
#include <mise/version.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <stdexcept>
#include <string_view>

namespace mise::server {

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "mise server " << Version() << "\n\n"
            << "Usage: " << argv0 << " [options]\n\n"
            << "  -c, --config <file>   settings file (server/metrics/images sections)\n"
            << "      --host <addr>     listen address [0.0.0.0]\n"
            << "  -p, --port <n>        listen port [8080]\n"
            << "      --threads <n>     I/O threads, 0 for one per core [0]\n"
            << "      --log-level <l>   debug | info | warn | error [info]\n"
            << "      --no-metrics      do not serve /metrics\n"
            << "  -h, --help            print this message\n\n"
            << "Flags override values from the settings file.\n";
}

// Strip one pair of matching quotes.
std::string Unquote(std::string_view value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    value = value.substr(1, value.size() - 2);
  }
  return std::string(value);
}

bool ParseBool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes" || value == "on";
}

uint64_t ParseUnsigned(const std::string& value, const std::string& what,
                       uint64_t max) {
  size_t consumed = 0;
  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error("Invalid " + what + ": '" + value + "'");
  }
  if (consumed != value.size() || value[0] == '-' || parsed > max) {
    throw std::runtime_error("Invalid " + what + ": '" + value + "'");
  }
  return parsed;
}

uint16_t ParsePort(const std::string& value) {
  return static_cast<uint16_t>(
      ParseUnsigned(value, "port", std::numeric_limits<uint16_t>::max()));
}

uint32_t ParseThreads(const std::string& value) {
  return static_cast<uint32_t>(ParseUnsigned(value, "thread count", 1024));
}

using Setter = void (*)(Config*, const std::string&);

// Settings file keys, as "<section>.<key>". Unknown keys are ignored.
const std::map<std::string, Setter> kSettings = {
    {"server.host", [](Config* c, const std::string& v) { c->server.host = v; }},
    {"server.port", [](Config* c, const std::string& v) { c->server.port = ParsePort(v); }},
    {"server.threads",
     [](Config* c, const std::string& v) { c->server.threads = ParseThreads(v); }},
    {"server.log_level", [](Config* c, const std::string& v) { c->server.log_level = v; }},
    {"metrics.enabled",
     [](Config* c, const std::string& v) { c->metrics.enabled = ParseBool(v); }},
    {"metrics.path", [](Config* c, const std::string& v) { c->metrics.path = v; }},
    {"images.bucket", [](Config* c, const std::string& v) { c->images.bucket = v; }},
    {"images.region", [](Config* c, const std::string& v) { c->images.region = v; }},
    {"images.key_prefix",
     [](Config* c, const std::string& v) { c->images.key_prefix = v; }},
};

// Returns the value following argv[*i], advancing *i.
std::string RequireValue(int argc, char** argv, int* i, const std::string& what) {
  std::string flag = argv[*i];
  if (++*i >= argc) {
    throw std::runtime_error(flag + " requires " + what);
  }
  return argv[*i];
}

}  // namespace

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Cannot read settings file: " + path);
  }

  Config config;
  std::string section;
  std::string raw;
  while (std::getline(in, raw)) {
    std::string_view line = internal::TrimView(raw);
    if (line.empty() || line.front() == '#') continue;

    size_t colon = line.find(':');
    if (colon == std::string_view::npos) continue;

    std::string_view key = internal::TrimView(line.substr(0, colon));
    std::string_view value = internal::TrimView(line.substr(colon + 1));
    if (value.empty()) {
      section = std::string(key);  // "images:" opens a section
      continue;
    }

    auto setter = kSettings.find(section + "." + std::string(key));
    if (setter != kSettings.end()) {
      setter->second(&config, Unquote(value));
    }
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  // The config file is the base layer, so find it before applying flags.
  Config config;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      config = LoadFromFile(RequireValue(argc, argv, &i, "a path argument"));
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      std::exit(0);
    } else if (arg == "--config" || arg == "-c") {
      ++i;  // already loaded
    } else if (arg == "--host") {
      config.server.host = RequireValue(argc, argv, &i, "an address argument");
    } else if (arg == "--port" || arg == "-p") {
      config.server.port = ParsePort(RequireValue(argc, argv, &i, "a port number"));
    } else if (arg == "--threads") {
      config.server.threads = ParseThreads(RequireValue(argc, argv, &i, "a number"));
    } else if (arg == "--log-level") {
      config.server.log_level = RequireValue(argc, argv, &i, "a level");
    } else if (arg == "--no-metrics") {
      config.metrics.enabled = false;
    } else if (!arg.empty() && arg[0] == '-') {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }

  return config;
}

void Config::Validate() const {
  if (server.port == 0) {
    throw std::runtime_error("Invalid port number: 0");
  }

  if (server.host.empty()) {
    throw std::runtime_error("server.host must not be empty");
  }

  if (server.log_level != "debug" && server.log_level != "info" &&
      server.log_level != "warn" && server.log_level != "error") {
    throw std::runtime_error("Invalid log_level: " + server.log_level +
                             " (must be debug, info, warn, or error)");
  }

  if (metrics.enabled && (metrics.path.empty() || metrics.path[0] != '/')) {
    throw std::runtime_error("metrics.path must start with '/': " + metrics.path);
  }

  if (!images.bucket.empty() && images.region.empty()) {
    throw std::runtime_error("images.region is required when images.bucket is set");
  }
}

}  // namespace mise::server
