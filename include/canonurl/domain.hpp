#pragma once

#include <string>
#include <string_view>

namespace canonurl {

/** Platform whose query policy applies to a URL. */
enum class Platform {
  kTwitter,   // twitter.com, x.com: status id lives in the path, query dropped
  kYouTube,   // youtube.com, youtu.be: keep v + list only
  kGeneric    // everything else: strip tracking params
};

/** How a hostname is compared against a platform domain. */
enum class HostMatching {
  kSuffix,    // exact or "." + domain suffix (default)
  kSubstring  // legacy containment check, e.g. "eviltwitter.com.attacker.net"
              //   counts as twitter
};

/**
 * True iff `hostname` equals `domain` or ends with "." + domain.
 *
 * `hostname` is expected lowercased with a leading "www." already removed;
 * `domain` is a bare registrable domain such as "twitter.com".
 */
bool MatchesDomain(std::string_view hostname, std::string_view domain);

/**
 * Classify a cleaned hostname. First match wins:
 *   twitter.com, x.com -> kTwitter
 *   youtube.com, youtu.be (exact only under kSuffix) -> kYouTube
 *   otherwise -> kGeneric
 */
Platform ClassifyHost(std::string_view hostname,
                      HostMatching matching = HostMatching::kSuffix);

/** "twitter", "youtube" or "generic". */
std::string_view PlatformName(Platform platform);

/** Lowercase (ASCII) and remove exactly one leading "www.". */
std::string CleanHost(std::string_view host);

/**
 * Host used in the canonical form of a cleaned hostname.
 *
 * x.com and its subdomains are folded onto twitter.com (mobile.x.com ->
 * mobile.twitter.com) so both domains of the same status compare equal.
 * Every other host is returned unchanged.
 */
std::string CanonicalHost(std::string_view hostname, Platform platform);

}  // namespace canonurl
