#pragma once

#include <canonurl/domain.hpp>
#include <canonurl/metrics.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace canonurl {

/** Which stage of the recovery pipeline produced a canonical URL. */
enum class NormalizeTier {
  kEmpty,         // empty or null input, result is ""
  kStrict,        // input parsed as an absolute URL
  kSchemeRepair,  // parsed after stripping leading '/' and prepending https://
  kManual         // string surgery on host; query left untouched
};

/** "empty", "strict", "scheme_repair" or "manual". */
std::string_view TierName(NormalizeTier tier);

/**
 * Options for canonurl::Normalizer.
 */
struct Options {
  // Host comparison used by DetectPlatform()/GetPlatform(). Normalization
  // itself always uses suffix matching. kSubstring reproduces the older,
  // looser platform labels for callers that stored them.
  HostMatching platform_matching = HostMatching::kSuffix;

  // Observability hook (optional)
  //
  // If set, every call emits a few counters and a latency histogram.
  // The sink must be thread-safe if the Normalizer is shared across threads.
  std::shared_ptr<MetricsSink> metrics;
};

/** Canonical form plus how it was obtained. */
struct NormalizeResult {
  std::string canonical;
  Platform platform = Platform::kGeneric;
  NormalizeTier tier = NormalizeTier::kEmpty;
  size_t params_removed = 0;  // query params dropped by the platform policy
};

/**
 * canonurl::Normalizer
 *
 * Turns a raw URL into a canonical string for content-identity comparison:
 *   host (lowercased, one leading "www." removed) + path + filtered query
 * with no scheme, port, userinfo or fragment.
 *
 * Query filtering depends on the host's platform:
 *  - twitter.com / x.com: query dropped
 *  - youtube.com / youtu.be: only v then list kept
 *  - anything else: tracking params (see TrackingParams()) removed
 *
 * Scheme-less inputs that do not parse get one repair attempt (https://
 * prepended); anything still unparsed gets a manual host-only cleanup.
 * mailto:, tel: and other URLs without "//" have no host; their canonical
 * form is the path plus the filtered query. No method throws.
 *
 * Stateless apart from Options; safe to share across threads.
 */
class Normalizer {
 public:
  Normalizer() = default;
  explicit Normalizer(Options options);

  /** Canonical form together with platform, tier and removal count. */
  NormalizeResult Explain(std::string_view url) const;

  /** Canonical form only. */
  std::string Normalize(std::string_view url) const;

  /** True iff both URLs have the same canonical form. */
  bool Match(std::string_view a, std::string_view b) const;

  /**
   * Platform of `url` using Options::platform_matching.
   * Only a strict parse is attempted; unparsable input is kGeneric.
   */
  Platform DetectPlatform(std::string_view url) const;

  /** PlatformName(DetectPlatform(url)). */
  std::string_view GetPlatform(std::string_view url) const;

  const Options& options() const { return options_; }

 private:
  Options options_;
};

// -----------------------------------------------------------------------------
// Convenience functions with default Options
// -----------------------------------------------------------------------------

/** Canonical URL; "" for empty input. */
std::string NormalizeUrl(std::string_view url);

/** Canonical URL; "" for nullptr. */
std::string NormalizeUrl(const char* url);

/** NormalizeUrl(a) == NormalizeUrl(b). */
bool UrlsMatch(std::string_view a, std::string_view b);
bool UrlsMatch(const char* a, const char* b);

/** "twitter", "youtube" or "generic"; "generic" on parse failure or nullptr. */
std::string_view GetPlatform(std::string_view url);
std::string_view GetPlatform(const char* url);

namespace internal {

/**
 * Strict tier: parse `url` and apply the platform query policy.
 * @return std::nullopt if `url` does not parse as an absolute URL
 */
std::optional<NormalizeResult> NormalizeStrict(std::string_view url);

/**
 * Scheme repair: strip leading '/' characters and prepend "https://".
 * @return std::nullopt if `url` already starts with a scheme (see SchemeLength)
 */
std::optional<std::string> RepairScheme(std::string_view url);

/**
 * Manual tier: strip a leading "http(s):" plus slashes (or bare leading
 * slashes), clean the host part and append the rest verbatim.
 */
std::string ManualFallback(std::string_view url);

}  // namespace internal
}  // namespace canonurl
