#pragma once

#define CANONURL_VERSION_MAJOR 0
#define CANONURL_VERSION_MINOR 1
#define CANONURL_VERSION_PATCH 0

#define CANONURL_VERSION_STRING "0.1.0"

// For compile-time version checks
#define CANONURL_VERSION \
  (CANONURL_VERSION_MAJOR * 10000 + CANONURL_VERSION_MINOR * 100 + CANONURL_VERSION_PATCH)

namespace canonurl {

inline const char* Version() { return CANONURL_VERSION_STRING; }

}  // namespace canonurl
