#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>

#include "clearcore/engine/transaction_engine.hpp"
#include "clearcore/ingest/csv_reader.hpp"
#include "clearcore/telemetry/telemetry_sink.hpp"

namespace clearcore {
namespace replay {

// Counter ids are outcome-based, latency ids are per transaction kind.
inline constexpr telemetry::MetricId kOutcomeMetricBase = 100;
inline constexpr telemetry::MetricId kLatencyMetricBase = 200;

[[nodiscard]] constexpr telemetry::MetricId outcome_metric(engine::Outcome outcome) noexcept {
  return kOutcomeMetricBase + static_cast<telemetry::MetricId>(outcome);
}

[[nodiscard]] constexpr telemetry::MetricId latency_metric(engine::TransactionKind kind) noexcept {
  return kLatencyMetricBase + static_cast<telemetry::MetricId>(kind);
}

class Driver {
 public:
  struct Options {
    ingest::CsvReader::Options input{};
    bool telemetry_enabled{true};
  };

  struct Summary {
    std::uint64_t lines{0};
    std::uint64_t decoded{0};
    std::uint64_t rejected{0};
    std::uint64_t applied{0};
    std::uint64_t ignored{0};
  };

  using ErrorHandler = ingest::CsvReader::ErrorHandler;
  using OutcomeHandler = engine::TransactionEngine::OutcomeHandler;

  Driver();

  void configure(Options options);
  void set_error_handler(ErrorHandler handler);
  void set_outcome_handler(OutcomeHandler handler);

  // Applies every decodable record in input order. The engine's outcome
  // handler is replaced for the duration of the call and restored on return
  // or throw.
  Summary execute(std::istream& input, engine::TransactionEngine& engine);
  Summary execute(const std::filesystem::path& path, engine::TransactionEngine& engine);

  [[nodiscard]] telemetry::TelemetrySink& telemetry() noexcept { return telemetry_; }

 private:
  Options options_{};
  ErrorHandler error_handler_{};
  OutcomeHandler outcome_handler_{};
  telemetry::TelemetrySink telemetry_{};
};

}  // namespace replay
}  // namespace clearcore
