#pragma once

#include <canonurl/domain.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace canonurl {

/**
 * One `name[=value]` segment of a query string.
 *
 * `raw` is the segment exactly as it appeared and is what gets serialized
 * back. `name` is form-decoded for matching; `value` is kept as written.
 */
struct QueryParam {
  std::string name;
  std::string value;
  std::string raw;
  bool has_value = false;
};

/** The exact tracking-parameter denylist, in declaration order. */
const std::vector<std::string_view>& TrackingParams();

/** Case-sensitive membership test against TrackingParams(). */
bool IsTrackingParam(std::string_view name);

/** YouTube parameters kept by the youtube policy, in output order. */
const std::vector<std::string_view>& YouTubeParams();

namespace internal {

/**
 * Split a query string (without the leading '?') on '&'.
 * Empty segments are dropped; order is preserved.
 */
std::vector<QueryParam> ParseQuery(std::string_view query);

/** Join the raw segments with '&'. */
std::string SerializeQuery(const std::vector<QueryParam>& params);

/** Decode '+' and %XX escapes (application/x-www-form-urlencoded). */
std::string FormDecode(std::string_view in);

/**
 * Remove denylisted parameters, keeping the rest in order.
 * @param removed if non-null, incremented by the number of params removed
 */
std::string StripTrackingParams(std::string_view query, size_t* removed = nullptr);

/**
 * Keep the first `v` and then the first `list`, each only if its value is
 * non-empty. Later occurrences are never consulted.
 * @param removed if non-null, incremented by the number of params dropped
 */
std::string RetainYouTubeParams(std::string_view query, size_t* removed = nullptr);

/** Dispatch to the query policy for `platform`. */
std::string ApplyQueryPolicy(Platform platform, std::string_view query,
                             size_t* removed = nullptr);

}  // namespace internal
}  // namespace canonurl
