#pragma once

#define MISE_VERSION_MAJOR 0
#define MISE_VERSION_MINOR 1
#define MISE_VERSION_PATCH 0

#define MISE_VERSION_STRING "0.1.0"

// For compile-time version checks
#define MISE_VERSION \
  (MISE_VERSION_MAJOR * 10000 + MISE_VERSION_MINOR * 100 + MISE_VERSION_PATCH)

namespace mise {

inline const char* Version() { return MISE_VERSION_STRING; }

}  // namespace mise
