#include <canonurl/url_parser.hpp>

#include <algorithm>
#include <cctype>
#include <memory>

namespace canonurl::internal {

namespace {

struct CurlUrlDeleter {
  void operator()(CURLU* handle) const { curl_url_cleanup(handle); }
};
using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;

struct CurlStringDeleter {
  void operator()(char* p) const { curl_free(p); }
};
using CurlStringPtr = std::unique_ptr<char, CurlStringDeleter>;

// C0 controls and space, trimmed from both ends like a browser URL parser.
inline bool IsTrimmable(char c) {
  return static_cast<unsigned char>(c) <= 0x20;
}

std::string_view TrimControls(std::string_view s) {
  while (!s.empty() && IsTrimmable(s.front())) s.remove_prefix(1);
  while (!s.empty() && IsTrimmable(s.back())) s.remove_suffix(1);
  return s;
}

// Fetch one URL part. Parts that are legitimately absent (no query, no host
// on a file: URL) come back empty instead of failing the parse.
CURLUcode GetPart(CURLU* handle, CURLUPart part, std::string* out) {
  char* raw = nullptr;
  CURLUcode rc = curl_url_get(handle, part, &raw, 0);
  CurlStringPtr holder(raw);

  if (rc == CURLUE_NO_QUERY || rc == CURLUE_NO_HOST) {
    out->clear();
    return CURLUE_OK;
  }
  if (rc != CURLUE_OK) return rc;

  out->assign(raw ? raw : "");
  return CURLUE_OK;
}

bool IsSchemeChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

// Schemes that always carry an authority; "https:host" means "https://host".
bool IsSpecialScheme(std::string_view scheme) {
  return scheme == "http" || scheme == "https" || scheme == "ws" ||
         scheme == "wss" || scheme == "ftp";
}

std::string Lowercase(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

void EncodeSpaces(std::string* s) {
  size_t pos = 0;
  while ((pos = s->find(' ', pos)) != std::string::npos) {
    s->replace(pos, 1, "%20");
    pos += 3;
  }
}

// scheme ":" opaque-path [ "?" query ] [ "#" fragment ]
ParsedUrl ParseOpaque(std::string scheme, std::string_view rest) {
  rest = rest.substr(0, rest.find('#'));

  ParsedUrl parsed;
  parsed.scheme = std::move(scheme);
  const size_t q = rest.find('?');
  parsed.path = std::string(rest.substr(0, q));
  if (q != std::string_view::npos) {
    parsed.query = std::string(rest.substr(q + 1));
    EncodeSpaces(&parsed.query);
  }
  return parsed;
}

}  // namespace

size_t SchemeLength(std::string_view url) {
  if (url.empty() || !std::isalpha(static_cast<unsigned char>(url[0]))) return 0;
  for (size_t i = 1; i < url.size(); ++i) {
    if (url[i] == ':') return i;
    if (!IsSchemeChar(url[i])) return 0;
  }
  return 0;
}

std::optional<ParsedUrl> ParseUrl(std::string_view url, CURLUcode* error) {
  auto fail = [error](CURLUcode rc) -> std::optional<ParsedUrl> {
    if (error) *error = rc;
    return std::nullopt;
  };

  url = TrimControls(url);
  if (url.empty() || url.find('\0') != std::string_view::npos) {
    return fail(CURLUE_MALFORMED_INPUT);
  }

  std::string text(url);
  const size_t scheme_len = SchemeLength(url);
  if (scheme_len > 0 && url.substr(scheme_len + 1, 2) != "//") {
    std::string scheme = Lowercase(url.substr(0, scheme_len));
    std::string_view rest = url.substr(scheme_len + 1);
    if (!IsSpecialScheme(scheme)) {
      if (error) *error = CURLUE_OK;
      return ParseOpaque(std::move(scheme), rest);
    }
    rest.remove_prefix(std::min(rest.find_first_not_of('/'), rest.size()));
    text = scheme + "://" + std::string(rest);
  }

  CurlUrlPtr handle(curl_url());
  if (!handle) return fail(CURLUE_OUT_OF_MEMORY);

  CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, text.c_str(),
                              CURLU_NON_SUPPORT_SCHEME | CURLU_ALLOW_SPACE);
  if (rc != CURLUE_OK) return fail(rc);

  ParsedUrl parsed;
  if ((rc = GetPart(handle.get(), CURLUPART_SCHEME, &parsed.scheme)) != CURLUE_OK ||
      (rc = GetPart(handle.get(), CURLUPART_HOST, &parsed.host)) != CURLUE_OK ||
      (rc = GetPart(handle.get(), CURLUPART_PATH, &parsed.path)) != CURLUE_OK ||
      (rc = GetPart(handle.get(), CURLUPART_QUERY, &parsed.query)) != CURLUE_OK) {
    return fail(rc);
  }

  if (parsed.path.empty()) parsed.path = "/";
  EncodeSpaces(&parsed.path);
  EncodeSpaces(&parsed.query);

  if (error) *error = CURLUE_OK;
  return parsed;
}

}  // namespace canonurl::internal
