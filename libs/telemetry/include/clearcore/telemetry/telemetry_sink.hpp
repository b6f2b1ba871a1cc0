#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <limits>
#include <map>
#include <mutex>
#include <vector>

namespace clearcore {
namespace telemetry {

using MetricId = std::uint32_t;

struct Sample {
  MetricId id{};
  std::int64_t value{};
};

// Log2-bucketed latency histogram, 1ns to ~1s. Recording is O(1).
class StreamingHistogram {
 public:
  static constexpr std::size_t kNumBuckets = 30;

  void record(std::int64_t value_ns) noexcept;
  void reset() noexcept;

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
  [[nodiscard]] std::int64_t min() const noexcept { return count_ == 0 ? 0 : min_; }
  [[nodiscard]] std::int64_t max() const noexcept { return max_; }
  [[nodiscard]] double mean() const noexcept;
  [[nodiscard]] double percentile(double p) const noexcept;

 private:
  std::array<std::uint64_t, kNumBuckets> buckets_{};
  std::uint64_t count_{0};
  std::int64_t sum_{0};
  std::int64_t min_{std::numeric_limits<std::int64_t>::max()};
  std::int64_t max_{0};

  static std::size_t bucket_index(std::int64_t value_ns) noexcept;
  static std::int64_t bucket_midpoint(std::size_t idx) noexcept;
};

class TelemetrySink {
 public:
  struct LatencySummary {
    MetricId id{0};
    std::uint64_t count{0};
    double mean_ns{0.0};
    double p99_ns{0.0};
    std::int64_t max_ns{0};
  };

  // push() buffers the sample for drain() and adds it to the running totals.
  // increment() only touches the totals.
  void push(Sample sample);
  void increment(MetricId id, std::int64_t delta = 1);
  void record_latency(MetricId id, std::chrono::nanoseconds latency);

  // Running totals per counter id since the last drain.
  [[nodiscard]] std::map<MetricId, std::int64_t> counters() const;
  [[nodiscard]] std::size_t buffered() const;
  [[nodiscard]] std::vector<Sample> drain();
  [[nodiscard]] std::vector<LatencySummary> drain_latency();

 private:
  mutable std::mutex mutex_;
  std::vector<Sample> buffer_{};
  std::map<MetricId, std::int64_t> totals_{};
  std::map<MetricId, StreamingHistogram> histograms_{};
};

}  // namespace telemetry
}  // namespace clearcore
