#include "test_telemetry.hpp"

#include <cassert>
#include <chrono>
#include "clearcore/telemetry/telemetry_sink.hpp"

namespace clearcore::tests {

void test_telemetry_sink() {
  telemetry::TelemetrySink sink;
  sink.push({.id = 1, .value = 99});
  sink.increment(1, 2);
  sink.increment(5);
  sink.record_latency(7, std::chrono::nanoseconds{100});
  sink.record_latency(7, std::chrono::nanoseconds{200});

  const auto counters = sink.counters();
  assert(counters.at(1) == 101);
  assert(counters.at(5) == 1);

  // Only push() buffers samples; increment() feeds the totals alone.
  assert(sink.buffered() == 1);
  auto samples = sink.drain();
  assert(samples.size() == 1);
  assert(samples.front().value == 99);
  assert(sink.buffered() == 0);
  assert(sink.counters().empty());

  auto latency = sink.drain_latency();
  assert(latency.size() == 1);
  assert(latency.front().id == 7);
  assert(latency.front().count == 2);
  assert(latency.front().max_ns == 200);
  assert(sink.drain_latency().empty());
}

void test_streaming_histogram() {
  telemetry::StreamingHistogram hist;
  assert(hist.percentile(0.99) == 0.0);

  hist.record(1);
  hist.record(1);
  hist.record(3);
  hist.record(1'000);
  assert(hist.count() == 4);
  assert(hist.min() == 1);
  assert(hist.max() == 1'000);
  assert(hist.mean() == 251.25);
  assert(hist.percentile(0.5) == 1.0);
  assert(hist.percentile(1.0) <= 1'000.0);

  hist.reset();
  assert(hist.count() == 0);
  assert(hist.mean() == 0.0);
}

}  // namespace clearcore::tests
