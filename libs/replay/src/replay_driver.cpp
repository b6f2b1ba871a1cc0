#include "clearcore/replay/replay_driver.hpp"

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace clearcore {
namespace replay {

namespace {

// Puts the caller's outcome handler back on every exit path of execute().
class OutcomeHandlerRestore {
 public:
  explicit OutcomeHandlerRestore(engine::TransactionEngine& engine)
      : engine_(engine), previous_(engine.outcome_handler()) {}
  OutcomeHandlerRestore(const OutcomeHandlerRestore&) = delete;
  OutcomeHandlerRestore& operator=(const OutcomeHandlerRestore&) = delete;
  ~OutcomeHandlerRestore() { engine_.set_outcome_handler(std::move(previous_)); }

 private:
  engine::TransactionEngine& engine_;
  engine::TransactionEngine::OutcomeHandler previous_;
};

}  // namespace

Driver::Driver() = default;

void Driver::configure(Options options) {
  options_ = options;
}

void Driver::set_error_handler(ErrorHandler handler) {
  error_handler_ = std::move(handler);
}

void Driver::set_outcome_handler(OutcomeHandler handler) {
  outcome_handler_ = std::move(handler);
}

Driver::Summary Driver::execute(std::istream& input, engine::TransactionEngine& engine) {
  Summary summary;

  ingest::CsvReader reader(input, options_.input);
  reader.set_error_handler(error_handler_);

  OutcomeHandlerRestore restore(engine);
  engine.set_outcome_handler([&](const engine::Transaction& tx, engine::Outcome outcome) {
    if (outcome == engine::Outcome::kApplied) {
      ++summary.applied;
    } else {
      ++summary.ignored;
    }
    if (options_.telemetry_enabled) {
      telemetry_.increment(outcome_metric(outcome));
    }
    if (outcome_handler_) {
      outcome_handler_(tx, outcome);
    }
  });

  engine::Transaction transaction;
  while (reader.next(transaction)) {
    if (!options_.telemetry_enabled) {
      engine.apply(transaction);
      continue;
    }
    const auto started = std::chrono::steady_clock::now();
    engine.apply(transaction);
    telemetry_.record_latency(latency_metric(engine::kind_of(transaction)),
                              std::chrono::steady_clock::now() - started);
  }

  const auto& stats = reader.stats();
  summary.lines = stats.lines;
  summary.decoded = stats.decoded;
  summary.rejected = stats.rejected;
  return summary;
}

Driver::Summary Driver::execute(const std::filesystem::path& path, engine::TransactionEngine& engine) {
  std::ifstream input(path);
  if (!input) {
    throw std::runtime_error("failed to open transaction log: " + path.string());
  }
  return execute(input, engine);
}

}  // namespace replay
}  // namespace clearcore
