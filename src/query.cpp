#include <canonurl/query.hpp>

#include <algorithm>

namespace canonurl {

namespace {

inline int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// First occurrence of `name`, or nullptr if absent or its value is empty.
const QueryParam* FindFirstWithValue(const std::vector<QueryParam>& params,
                                    std::string_view name) {
  for (const auto& p : params) {
    if (p.name == name) return p.value.empty() ? nullptr : &p;
  }
  return nullptr;
}

}  // namespace

const std::vector<std::string_view>& TrackingParams() {
  static const std::vector<std::string_view> kParams = {
      // Google Analytics & marketing
      "utm_source", "utm_medium", "utm_campaign", "utm_content", "utm_term",
      "utm_id", "utm_source_platform", "utm_creative_format", "utm_marketing_tactic",
      "_ga", "_gl", "gclid", "gclsrc",

      // Social click ids
      "fbclid", "fb_action_ids", "fb_action_types", "fb_source", "fb_ref",
      "msclkid", "igshid",

      // Referral
      "ref", "ref_src", "ref_url", "source",

      // Email marketing
      "mc_cid", "mc_eid",

      // Ad platforms, share widgets
      "campaign_id", "ad_id", "adset_id", "ad_name", "adset_name", "campaign_name",
      "share", "shared"};
  return kParams;
}

bool IsTrackingParam(std::string_view name) {
  const auto& params = TrackingParams();
  return std::find(params.begin(), params.end(), name) != params.end();
}

const std::vector<std::string_view>& YouTubeParams() {
  static const std::vector<std::string_view> kParams = {"v", "list"};
  return kParams;
}

namespace internal {

std::string FormDecode(std::string_view in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    char c = in[i];
    if (c == '+') {
      out += ' ';
    } else if (c == '%' && i + 2 < in.size() &&
               HexValue(in[i + 1]) >= 0 && HexValue(in[i + 2]) >= 0) {
      out += static_cast<char>(HexValue(in[i + 1]) * 16 + HexValue(in[i + 2]));
      i += 2;
    } else {
      out += c;
    }
  }
  return out;
}

std::vector<QueryParam> ParseQuery(std::string_view query) {
  std::vector<QueryParam> params;
  size_t start = 0;
  while (start <= query.size()) {
    size_t amp = query.find('&', start);
    if (amp == std::string_view::npos) amp = query.size();

    std::string_view segment = query.substr(start, amp - start);
    if (!segment.empty()) {
      QueryParam p;
      p.raw = std::string(segment);
      size_t eq = segment.find('=');
      if (eq == std::string_view::npos) {
        p.name = FormDecode(segment);
      } else {
        p.name = FormDecode(segment.substr(0, eq));
        p.value = std::string(segment.substr(eq + 1));
        p.has_value = true;
      }
      params.push_back(std::move(p));
    }
    start = amp + 1;
  }
  return params;
}

std::string SerializeQuery(const std::vector<QueryParam>& params) {
  std::string out;
  for (const auto& p : params) {
    if (!out.empty()) out += '&';
    out += p.raw;
  }
  return out;
}

std::string StripTrackingParams(std::string_view query, size_t* removed) {
  auto params = ParseQuery(query);
  const size_t before = params.size();
  params.erase(std::remove_if(params.begin(), params.end(),
                              [](const QueryParam& p) { return IsTrackingParam(p.name); }),
               params.end());
  if (removed) *removed += before - params.size();
  return SerializeQuery(params);
}

std::string RetainYouTubeParams(std::string_view query, size_t* removed) {
  auto params = ParseQuery(query);

  std::string out;
  size_t kept = 0;
  for (auto name : YouTubeParams()) {
    const QueryParam* p = FindFirstWithValue(params, name);
    if (!p) continue;
    if (!out.empty()) out += '&';
    out.append(name.data(), name.size());
    out += '=';
    out += p->value;
    ++kept;
  }

  if (removed) *removed += params.size() - kept;
  return out;
}

std::string ApplyQueryPolicy(Platform platform, std::string_view query,
                             size_t* removed) {
  switch (platform) {
    case Platform::kTwitter:
      // Status id lives in the path; the whole query is noise.
      if (removed) *removed += ParseQuery(query).size();
      return std::string();
    case Platform::kYouTube:
      return RetainYouTubeParams(query, removed);
    case Platform::kGeneric:
      break;
  }
  return StripTrackingParams(query, removed);
}

}  // namespace internal
}  // namespace canonurl
