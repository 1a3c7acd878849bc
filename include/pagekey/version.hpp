#pragma once

#define PAGEKEY_VERSION_MAJOR 0
#define PAGEKEY_VERSION_MINOR 1
#define PAGEKEY_VERSION_PATCH 0

#define PAGEKEY_VERSION_STRING "0.1.0"

// For compile-time version checks
#define PAGEKEY_VERSION \
  (PAGEKEY_VERSION_MAJOR * 10000 + PAGEKEY_VERSION_MINOR * 100 + PAGEKEY_VERSION_PATCH)

namespace pagekey {

inline const char* Version() { return PAGEKEY_VERSION_STRING; }

}  // namespace pagekey
