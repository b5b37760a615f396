#include <canonurl/normalizer.hpp>

#include <canonurl/query.hpp>
#include <canonurl/url_parser.hpp>

#include <chrono>
#include <cctype>

namespace canonurl {

namespace {

// --------------------------
// Observability helpers
// --------------------------
inline uint64_t NowMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

inline void EmitCounter(const Options& opt, std::string_view name, uint64_t delta = 1) {
  if (opt.metrics) opt.metrics->Counter(name, delta);
}

inline void EmitHistogram(const Options& opt, std::string_view name, uint64_t value) {
  if (opt.metrics) opt.metrics->Histogram(name, value);
}

std::string_view TierCounter(NormalizeTier tier) {
  switch (tier) {
    case NormalizeTier::kEmpty:
      return "canonurl.normalize.tier.empty";
    case NormalizeTier::kStrict:
      return "canonurl.normalize.tier.strict";
    case NormalizeTier::kSchemeRepair:
      return "canonurl.normalize.tier.scheme_repair";
    case NormalizeTier::kManual:
      break;
  }
  return "canonurl.normalize.tier.manual";
}

std::string_view PlatformCounter(Platform platform) {
  switch (platform) {
    case Platform::kTwitter:
      return "canonurl.normalize.platform.twitter";
    case Platform::kYouTube:
      return "canonurl.normalize.platform.youtube";
    case Platform::kGeneric:
      break;
  }
  return "canonurl.normalize.platform.generic";
}

bool StartsWithNoCase(std::string_view s, std::string_view prefix) {
  if (s.size() < prefix.size()) return false;
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i]) return false;
  }
  return true;
}

}  // namespace

std::string_view TierName(NormalizeTier tier) {
  switch (tier) {
    case NormalizeTier::kEmpty:
      return "empty";
    case NormalizeTier::kStrict:
      return "strict";
    case NormalizeTier::kSchemeRepair:
      return "scheme_repair";
    case NormalizeTier::kManual:
      break;
  }
  return "manual";
}

// -----------------------------------------------------------------------------
// Tiers
// -----------------------------------------------------------------------------

namespace internal {

std::optional<NormalizeResult> NormalizeStrict(std::string_view url) {
  auto parsed = ParseUrl(url);
  if (!parsed) return std::nullopt;

  NormalizeResult result;
  result.tier = NormalizeTier::kStrict;

  std::string host = CleanHost(parsed->host);
  result.platform = ClassifyHost(host);
  host = CanonicalHost(host, result.platform);

  std::string query = ApplyQueryPolicy(result.platform, parsed->query,
                                       &result.params_removed);

  result.canonical.reserve(host.size() + parsed->path.size() + query.size() + 1);
  result.canonical = std::move(host);
  result.canonical += parsed->path;
  if (!query.empty()) {
    result.canonical += '?';
    result.canonical += query;
  }
  return result;
}

std::optional<std::string> RepairScheme(std::string_view url) {
  // A string with a scheme is never rewritten into the authority of another.
  if (SchemeLength(url) > 0) return std::nullopt;

  size_t start = url.find_first_not_of('/');
  if (start == std::string_view::npos) start = url.size();

  std::string repaired = "https://";
  repaired.append(url.data() + start, url.size() - start);
  return repaired;
}

std::string ManualFallback(std::string_view url) {
  std::string_view stripped = url;

  size_t scheme_len = 0;
  if (StartsWithNoCase(url, "https:")) {
    scheme_len = 6;
  } else if (StartsWithNoCase(url, "http:")) {
    scheme_len = 5;
  }

  // The scheme is only stripped together with at least one slash.
  size_t after_slashes = scheme_len;
  while (after_slashes < url.size() && url[after_slashes] == '/') ++after_slashes;
  if (after_slashes > scheme_len) {
    stripped = url.substr(after_slashes);
  }

  const size_t split = stripped.find_first_of("/?#");
  if (split == std::string_view::npos) {
    return CleanHost(stripped);
  }

  std::string out = CleanHost(stripped.substr(0, split));
  out.append(stripped.data() + split, stripped.size() - split);
  return out;
}

}  // namespace internal

// -----------------------------------------------------------------------------
// Normalizer
// -----------------------------------------------------------------------------

Normalizer::Normalizer(Options options) : options_(std::move(options)) {}

NormalizeResult Normalizer::Explain(std::string_view url) const {
  const uint64_t start_us = NowMicros();
  EmitCounter(options_, "canonurl.normalize.calls");

  NormalizeResult result;
  if (!url.empty()) {
    if (auto strict = internal::NormalizeStrict(url)) {
      result = std::move(*strict);
    } else if (auto repaired = internal::RepairScheme(url);
               repaired && (strict = internal::NormalizeStrict(*repaired))) {
      result = std::move(*strict);
      result.tier = NormalizeTier::kSchemeRepair;
    } else {
      result.canonical = internal::ManualFallback(url);
      result.tier = NormalizeTier::kManual;
      const size_t host_end = result.canonical.find_first_of("/?#");
      result.platform = ClassifyHost(std::string_view(result.canonical).substr(0, host_end));
    }
  }

  EmitCounter(options_, TierCounter(result.tier));
  if (result.tier != NormalizeTier::kEmpty) {
    EmitCounter(options_, PlatformCounter(result.platform));
  }
  if (result.params_removed > 0) {
    EmitCounter(options_, "canonurl.normalize.params_removed", result.params_removed);
  }
  EmitHistogram(options_, "canonurl.normalize.latency_us", NowMicros() - start_us);
  return result;
}

std::string Normalizer::Normalize(std::string_view url) const {
  return Explain(url).canonical;
}

bool Normalizer::Match(std::string_view a, std::string_view b) const {
  EmitCounter(options_, "canonurl.match.calls");
  const bool equal = Normalize(a) == Normalize(b);
  if (equal) EmitCounter(options_, "canonurl.match.equal");
  return equal;
}

Platform Normalizer::DetectPlatform(std::string_view url) const {
  auto parsed = internal::ParseUrl(url);
  if (!parsed) return Platform::kGeneric;
  return ClassifyHost(CleanHost(parsed->host), options_.platform_matching);
}

std::string_view Normalizer::GetPlatform(std::string_view url) const {
  return PlatformName(DetectPlatform(url));
}

// -----------------------------------------------------------------------------
// Convenience functions
// -----------------------------------------------------------------------------

std::string NormalizeUrl(std::string_view url) {
  return Normalizer().Normalize(url);
}

std::string NormalizeUrl(const char* url) {
  if (!url) return std::string();
  return NormalizeUrl(std::string_view(url));
}

bool UrlsMatch(std::string_view a, std::string_view b) {
  return Normalizer().Match(a, b);
}

bool UrlsMatch(const char* a, const char* b) {
  return UrlsMatch(a ? std::string_view(a) : std::string_view(),
                   b ? std::string_view(b) : std::string_view());
}

std::string_view GetPlatform(std::string_view url) {
  return Normalizer().GetPlatform(url);
}

std::string_view GetPlatform(const char* url) {
  if (!url) return PlatformName(Platform::kGeneric);
  return GetPlatform(std::string_view(url));
}

}  // namespace canonurl
