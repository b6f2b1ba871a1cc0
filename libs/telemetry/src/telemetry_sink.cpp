#include "clearcore/telemetry/telemetry_sink.hpp"

#include <algorithm>
#include <bit>

namespace clearcore {
namespace telemetry {

// bucket[i] covers [2^(i-1), 2^i); bucket 0 holds non-positive samples.
std::size_t StreamingHistogram::bucket_index(std::int64_t value_ns) noexcept {
  if (value_ns <= 0) {
    return 0;
  }
  const auto bits = std::bit_width(static_cast<std::uint64_t>(value_ns));
  return std::min(static_cast<std::size_t>(bits), kNumBuckets - 1);
}

std::int64_t StreamingHistogram::bucket_midpoint(std::size_t idx) noexcept {
  if (idx <= 1) {
    return static_cast<std::int64_t>(idx);
  }
  // 1.5 * 2^(idx-1)
  return static_cast<std::int64_t>(3) << (idx - 2);
}

void StreamingHistogram::record(std::int64_t value_ns) noexcept {
  ++buckets_[bucket_index(value_ns)];
  ++count_;
  sum_ += value_ns;
  min_ = std::min(min_, value_ns);
  max_ = std::max(max_, value_ns);
}

void StreamingHistogram::reset() noexcept {
  buckets_.fill(0);
  count_ = 0;
  sum_ = 0;
  min_ = std::numeric_limits<std::int64_t>::max();
  max_ = 0;
}

double StreamingHistogram::mean() const noexcept {
  if (count_ == 0) {
    return 0.0;
  }
  return static_cast<double>(sum_) / static_cast<double>(count_);
}

double StreamingHistogram::percentile(double p) const noexcept {
  if (count_ == 0) {
    return 0.0;
  }

  const auto target = static_cast<std::uint64_t>(static_cast<double>(count_) * p);
  std::uint64_t cumulative = 0;
  for (std::size_t idx = 0; idx < kNumBuckets; ++idx) {
    cumulative += buckets_[idx];
    if (cumulative >= target && cumulative > 0) {
      return static_cast<double>(std::min(bucket_midpoint(idx), max_));
    }
  }
  return static_cast<double>(max_);
}

void TelemetrySink::push(Sample sample) {
  std::scoped_lock lock(mutex_);
  buffer_.push_back(sample);
  totals_[sample.id] += sample.value;
}

void TelemetrySink::increment(MetricId id, std::int64_t delta) {
  std::scoped_lock lock(mutex_);
  totals_[id] += delta;
}

void TelemetrySink::record_latency(MetricId id, std::chrono::nanoseconds latency) {
  std::scoped_lock lock(mutex_);
  histograms_[id].record(latency.count());
}

std::map<MetricId, std::int64_t> TelemetrySink::counters() const {
  std::scoped_lock lock(mutex_);
  return totals_;
}

std::size_t TelemetrySink::buffered() const {
  std::scoped_lock lock(mutex_);
  return buffer_.size();
}

std::vector<Sample> TelemetrySink::drain() {
  std::scoped_lock lock(mutex_);
  auto copy = std::move(buffer_);
  buffer_.clear();
  totals_.clear();
  return copy;
}

std::vector<TelemetrySink::LatencySummary> TelemetrySink::drain_latency() {
  std::scoped_lock lock(mutex_);
  std::vector<LatencySummary> summaries;
  summaries.reserve(histograms_.size());

  for (auto& [id, hist] : histograms_) {
    if (hist.count() == 0) {
      continue;
    }
    summaries.push_back(LatencySummary{
        .id = id,
        .count = hist.count(),
        .mean_ns = hist.mean(),
        .p99_ns = hist.percentile(0.99),
        .max_ns = hist.max(),
    });
  }
  histograms_.clear();
  return summaries;
}

}  // namespace telemetry
}  // namespace clearcore
