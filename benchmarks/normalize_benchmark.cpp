// Performance benchmarks for canonurl
// Uses Google Benchmark for accurate measurement and CI regression tracking
//
// Organization:
// 1. MICROBENCHMARKS: single stages (host matching, query filtering, parsing)
// 2. MACROBENCHMARKS: full Normalize/Match calls per recovery tier, and a
//    dedup pass over a pre-generated corpus
//
// Benchmark hygiene:
// - Pre-generate all test data outside timing loops
// - Use fixed dataset sizes and seeds for reproducible results

#include <benchmark/benchmark.h>

#include <canonurl/canonurl.hpp>
#include <canonurl/url_parser.hpp>

#include <cstdio>
#include <random>
#include <string>
#include <unordered_set>
#include <vector>

namespace {

// =============================================================================
// Benchmark Helpers
// =============================================================================

// Mix of platforms, tracking params and malformed inputs.
std::vector<std::string> MakeCorpus(size_t n, uint32_t seed = 42) {
  static const char* kTemplates[] = {
      "https://www.example.com/article/%d?id=%d&utm_source=twitter&utm_medium=social#top",
      "https://twitter.com/user/status/%d?s=%d&t=abc",
      "https://x.com/user/status/%d?s=%d",
      "https://www.youtube.com/watch?v=%d&list=PL%d&t=42&feature=share",
      "https://youtu.be/%d?si=%d",
      "example.org/page/%d?fbclid=%d&keep=1",
      "//cdn.example.net/asset/%d.js?v=%d",
      "https://shop.example.com/item/%d?gclid=%d&color=red&ref=home",
  };
  constexpr size_t kNumTemplates = sizeof(kTemplates) / sizeof(kTemplates[0]);

  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> id(0, 5000);
  std::vector<std::string> out;
  out.reserve(n);
  char buf[256];
  for (size_t i = 0; i < n; ++i) {
    std::snprintf(buf, sizeof(buf), kTemplates[i % kNumTemplates], id(gen), id(gen));
    out.emplace_back(buf);
  }
  return out;
}

// =============================================================================
// PART 1: MICROBENCHMARKS
// =============================================================================

static void BM_MatchesDomain(benchmark::State& state) {
  const std::string host = "mobile.twitter.com";
  for (auto _ : state) {
    bool m = canonurl::MatchesDomain(host, "twitter.com");
    benchmark::DoNotOptimize(m);
  }
}
BENCHMARK(BM_MatchesDomain);

static void BM_ClassifyHost(benchmark::State& state) {
  const std::vector<std::string> hosts = {"twitter.com", "m.youtube.com",
                                          "youtu.be", "news.example.co.uk"};
  size_t i = 0;
  for (auto _ : state) {
    auto p = canonurl::ClassifyHost(hosts[i++ % hosts.size()]);
    benchmark::DoNotOptimize(p);
  }
}
BENCHMARK(BM_ClassifyHost);

static void BM_StripTrackingParams(benchmark::State& state) {
  // state.range(0) params, every other one a tracking param
  std::string query;
  for (int64_t i = 0; i < state.range(0); ++i) {
    if (!query.empty()) query += '&';
    query += (i % 2 == 0) ? "utm_source=x" : "k" + std::to_string(i) + "=v";
  }
  for (auto _ : state) {
    auto out = canonurl::internal::StripTrackingParams(query);
    benchmark::DoNotOptimize(out);
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_StripTrackingParams)->RangeMultiplier(4)->Range(1, 256)->Complexity();

static void BM_ParseUrl(benchmark::State& state) {
  const std::string url =
      "https://www.example.com/a/b/c?id=123&utm_source=twitter#frag";
  for (auto _ : state) {
    auto parsed = canonurl::internal::ParseUrl(url);
    benchmark::DoNotOptimize(parsed);
  }
}
BENCHMARK(BM_ParseUrl);

// =============================================================================
// PART 2: MACROBENCHMARKS - full normalization
// =============================================================================

static void BM_Normalize_Strict(benchmark::State& state) {
  canonurl::Normalizer normalizer;
  const std::string url =
      "https://www.example.com/article?id=123&utm_source=twitter&utm_medium=social#c";
  for (auto _ : state) {
    auto canonical = normalizer.Normalize(url);
    benchmark::DoNotOptimize(canonical);
  }
}
BENCHMARK(BM_Normalize_Strict);

static void BM_Normalize_SchemeRepair(benchmark::State& state) {
  canonurl::Normalizer normalizer;
  const std::string url = "//www.example.com/article?id=123&fbclid=abc";
  for (auto _ : state) {
    auto canonical = normalizer.Normalize(url);
    benchmark::DoNotOptimize(canonical);
  }
}
BENCHMARK(BM_Normalize_SchemeRepair);

static void BM_Normalize_Manual(benchmark::State& state) {
  canonurl::Normalizer normalizer;
  const std::string url = "http://exa mple.com/path with spaces?q=1";
  for (auto _ : state) {
    auto canonical = normalizer.Normalize(url);
    benchmark::DoNotOptimize(canonical);
  }
}
BENCHMARK(BM_Normalize_Manual);

static void BM_UrlsMatch(benchmark::State& state) {
  canonurl::Normalizer normalizer;
  const std::string a = "https://x.com/user/status/1?s=20";
  const std::string b = "https://twitter.com/user/status/1";
  for (auto _ : state) {
    bool m = normalizer.Match(a, b);
    benchmark::DoNotOptimize(m);
  }
}
BENCHMARK(BM_UrlsMatch);

static void BM_GetPlatform(benchmark::State& state) {
  canonurl::Normalizer normalizer;
  const std::string url = "https://www.youtube.com/watch?v=abc";
  for (auto _ : state) {
    auto label = normalizer.GetPlatform(url);
    benchmark::DoNotOptimize(label);
  }
}
BENCHMARK(BM_GetPlatform);

static void BM_Dedup_Corpus(benchmark::State& state) {
  auto corpus = MakeCorpus(static_cast<size_t>(state.range(0)));
  canonurl::Normalizer normalizer;
  for (auto _ : state) {
    std::unordered_set<std::string> seen;
    for (const auto& url : corpus) {
      seen.insert(normalizer.Normalize(url));
    }
    benchmark::DoNotOptimize(seen.size());
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Dedup_Corpus)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_Normalize_Threaded(benchmark::State& state) {
  static const auto corpus = MakeCorpus(1024);
  static const canonurl::Normalizer normalizer;
  size_t i = static_cast<size_t>(state.thread_index()) * 97;
  for (auto _ : state) {
    auto canonical = normalizer.Normalize(corpus[i++ % corpus.size()]);
    benchmark::DoNotOptimize(canonical);
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Normalize_Threaded)->ThreadRange(1, 8);

}  // namespace

BENCHMARK_MAIN();
