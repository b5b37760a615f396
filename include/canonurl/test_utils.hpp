#pragma once

#include <canonurl/metrics.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace canonurl::testing {

// =============================================================================
// Recording Metrics Sink
// =============================================================================

/**
 * MetricsSink that keeps everything it is given, for assertions.
 * Thread-safe so one instance can be shared by concurrent callers.
 */
class RecordingMetrics : public MetricsSink {
 public:
  void Counter(std::string_view name, uint64_t delta) override {
    std::lock_guard<std::mutex> lock(mu_);
    counters_[std::string(name)] += delta;
  }

  void Histogram(std::string_view name, uint64_t value) override {
    std::lock_guard<std::mutex> lock(mu_);
    histograms_[std::string(name)].push_back(value);
  }

  void Gauge(std::string_view name, double value) override {
    std::lock_guard<std::mutex> lock(mu_);
    gauges_[std::string(name)] = value;
  }

  /** Counter value, 0 if never emitted. */
  uint64_t CounterValue(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
  }

  /** Number of samples recorded for a histogram. */
  size_t HistogramCount(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = histograms_.find(name);
    return it == histograms_.end() ? 0 : it->second.size();
  }

  void Reset() {
    std::lock_guard<std::mutex> lock(mu_);
    counters_.clear();
    histograms_.clear();
    gauges_.clear();
  }

 private:
  mutable std::mutex mu_;
  std::map<std::string, uint64_t> counters_;
  std::map<std::string, std::vector<uint64_t>> histograms_;
  std::map<std::string, double> gauges_;
};

// =============================================================================
// Concurrent Test Support
// =============================================================================

/**
 * Thread-safe result collector for concurrent tests.
 * Collects results from multiple threads for assertion on main thread.
 */
class TestResultCollector {
 public:
  void RecordSuccess() {
    success_count_.fetch_add(1);
  }

  void RecordFailure(const std::string& message = "") {
    failure_count_.fetch_add(1);
    if (!message.empty()) {
      std::lock_guard<std::mutex> lock(mutex_);
      failure_messages_.push_back(message);
    }
  }

  uint64_t SuccessCount() const { return success_count_.load(); }
  uint64_t FailureCount() const { return failure_count_.load(); }

  bool AllSucceeded() const { return FailureCount() == 0; }

  std::vector<std::string> GetFailureMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_messages_;
  }

 private:
  std::atomic<uint64_t> success_count_{0};
  std::atomic<uint64_t> failure_count_{0};
  mutable std::mutex mutex_;
  std::vector<std::string> failure_messages_;
};

// Use these instead of ASSERT_*/EXPECT_* inside threads
#define RECORD_SUCCESS(collector) (collector).RecordSuccess()
#define RECORD_FAILURE(collector, msg) (collector).RecordFailure(msg)

}  // namespace canonurl::testing
