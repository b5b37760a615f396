#include <canonurl/canonurl.hpp>

#include <iostream>

int main() {
  // Tracking parameters, fragment, scheme and "www." are dropped.
  std::cout << canonurl::NormalizeUrl(
                   "https://www.example.com/article?id=123&utm_source=twitter#comments")
            << "\n";

  // Twitter/X: the whole query goes, x.com folds onto twitter.com.
  std::cout << canonurl::NormalizeUrl("https://x.com/user/status/123?s=20&t=abc") << "\n";

  // YouTube: only v and list survive.
  std::cout << canonurl::NormalizeUrl("https://youtube.com/watch?v=abc&t=10&feature=share")
            << "\n";

  // Inputs without a scheme are repaired.
  std::cout << canonurl::NormalizeUrl("//cdn.example.net/lib.js?fbclid=1") << "\n";

  if (canonurl::UrlsMatch("https://mobile.twitter.com/a/status/1",
                          "https://twitter.com/a/status/1?s=20")) {
    std::cout << "same tweet\n";
  }

  std::cout << "platform=" << canonurl::GetPlatform("https://youtu.be/abc") << "\n";

  // Explain() reports how the canonical form was obtained.
  canonurl::Normalizer normalizer;
  auto r = normalizer.Explain("example.com/page?gclid=x&keep=1");
  std::cout << r.canonical << " tier=" << canonurl::TierName(r.tier)
            << " removed=" << r.params_removed << "\n";

  std::cout << "done\n";
  return 0;
}
