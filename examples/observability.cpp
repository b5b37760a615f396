#include <canonurl/canonurl.hpp>

#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace {

// A tiny in-process metrics collector for demo purposes.
//
// In real usage, you'd adapt canonurl::MetricsSink to your system's metrics
// library (Prometheus, OpenTelemetry metrics, StatsD, etc.).
class SimpleMetrics final : public canonurl::MetricsSink {
 public:
  void Counter(std::string_view name, uint64_t delta) override {
    std::lock_guard<std::mutex> lk(mu_);
    counters_[std::string(name)] += delta;
  }

  void Histogram(std::string_view name, uint64_t value) override {
    std::lock_guard<std::mutex> lk(mu_);
    auto& h = hists_[std::string(name)];
    h.count += 1;
    h.sum += value;
    if (value < h.min) h.min = value;
    if (value > h.max) h.max = value;
  }

  void Dump(std::ostream& os) const {
    std::lock_guard<std::mutex> lk(mu_);
    os << "\n== Counters ==\n";
    for (const auto& kv : counters_) {
      os << kv.first << " = " << kv.second << "\n";
    }
    os << "\n== Histograms (count, min, avg, max) ==\n";
    for (const auto& kv : hists_) {
      const auto& h = kv.second;
      const double avg = h.count ? static_cast<double>(h.sum) / static_cast<double>(h.count) : 0.0;
      os << kv.first
         << " count=" << h.count
         << " min=" << (h.count ? h.min : 0)
         << " avg=" << avg
         << " max=" << (h.count ? h.max : 0)
         << "\n";
    }
  }

 private:
  struct HistAgg {
    uint64_t count = 0;
    uint64_t sum = 0;
    uint64_t min = std::numeric_limits<uint64_t>::max();
    uint64_t max = 0;
  };

  mutable std::mutex mu_;
  std::unordered_map<std::string, uint64_t> counters_;
  std::unordered_map<std::string, HistAgg> hists_;
};

}  // namespace

int main() {
  auto metrics = std::make_shared<SimpleMetrics>();

  canonurl::Options opt;
  opt.metrics = metrics;
  canonurl::Normalizer normalizer(opt);

  // A few calls to generate signals, one per recovery tier.
  (void)normalizer.Normalize("https://www.example.com/a?utm_source=x&utm_medium=y");
  (void)normalizer.Normalize("youtube.com/watch?v=abc&t=1");
  (void)normalizer.Normalize("http://exa mple.com/a b");
  (void)normalizer.Normalize("");

  (void)normalizer.Match("https://x.com/u/status/1", "https://twitter.com/u/status/1");

  metrics->Dump(std::cout);
  return 0;
}
