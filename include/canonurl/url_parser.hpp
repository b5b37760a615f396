#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <curl/curl.h>

namespace canonurl::internal {

/**
 * Components of a parsed URL.
 *
 * Only what the canonical form needs is kept: port, userinfo and fragment
 * are parsed but dropped. Path and query are returned as written (no
 * percent-decoding) except that spaces become %20. A hierarchical URL with
 * an empty path comes back with "/".
 *
 * URLs without "//" after a non-special scheme (mailto:, tel:, urn:) have
 * an empty host and everything up to '?' as the path.
 */
struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string path;
  std::string query;  // without the leading '?'
};

/**
 * Length of the leading scheme (`[A-Za-z][A-Za-z0-9+.-]*` followed by ':'),
 * or 0 if `url` does not start with one.
 */
size_t SchemeLength(std::string_view url);

/**
 * Strict parse of an absolute URL.
 *
 * Hierarchical URLs go through libcurl. http, https, ws, wss and ftp
 * followed by fewer or more than two slashes are read as "scheme://".
 * Inputs without a scheme, or a hierarchical URL without a valid host,
 * are rejected. Spaces are accepted in path and query.
 *
 * @param url   The URL text
 * @param error If non-null, set to the libcurl error code on failure
 *              (CURLUE_OK on success)
 * @return Parsed components, or std::nullopt if the URL does not parse
 */
std::optional<ParsedUrl> ParseUrl(std::string_view url, CURLUcode* error = nullptr);

}  // namespace canonurl::internal
