#include <canonurl/domain.hpp>

#include <algorithm>
#include <cctype>

namespace canonurl {

namespace {

constexpr std::string_view kTwitterDomain = "twitter.com";
constexpr std::string_view kXDomain = "x.com";
constexpr std::string_view kTwitterDomains[] = {kTwitterDomain, kXDomain};
constexpr std::string_view kYouTubeDomain = "youtube.com";
constexpr std::string_view kYouTubeShortDomain = "youtu.be";

bool HostMatches(std::string_view hostname, std::string_view domain,
                 HostMatching matching) {
  if (matching == HostMatching::kSubstring) {
    return hostname.find(domain) != std::string_view::npos;
  }
  return MatchesDomain(hostname, domain);
}

}  // namespace

bool MatchesDomain(std::string_view hostname, std::string_view domain) {
  if (hostname == domain) return true;
  if (hostname.size() <= domain.size()) return false;

  const size_t dot = hostname.size() - domain.size() - 1;
  return hostname[dot] == '.' &&
         hostname.compare(dot + 1, std::string_view::npos, domain) == 0;
}

Platform ClassifyHost(std::string_view hostname, HostMatching matching) {
  for (auto domain : kTwitterDomains) {
    if (HostMatches(hostname, domain, matching)) return Platform::kTwitter;
  }

  if (HostMatches(hostname, kYouTubeDomain, matching)) return Platform::kYouTube;

  // youtu.be has no subdomains worth honoring
  if (matching == HostMatching::kSubstring
          ? hostname.find(kYouTubeShortDomain) != std::string_view::npos
          : hostname == kYouTubeShortDomain) {
    return Platform::kYouTube;
  }

  return Platform::kGeneric;
}

std::string_view PlatformName(Platform platform) {
  switch (platform) {
    case Platform::kTwitter:
      return "twitter";
    case Platform::kYouTube:
      return "youtube";
    case Platform::kGeneric:
      break;
  }
  return "generic";
}

std::string CleanHost(std::string_view host) {
  std::string out(host);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (out.compare(0, 4, "www.") == 0) {
    out.erase(0, 4);
  }
  return out;
}

std::string CanonicalHost(std::string_view hostname, Platform platform) {
  if (platform != Platform::kTwitter || !MatchesDomain(hostname, kXDomain)) {
    return std::string(hostname);
  }
  std::string out(hostname.substr(0, hostname.size() - kXDomain.size()));
  out.append(kTwitterDomain.data(), kTwitterDomain.size());
  return out;
}

}  // namespace canonurl
