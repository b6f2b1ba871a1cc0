#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <utility>

#include "clearcore/config/config_loader.hpp"
#include "clearcore/engine/transaction_engine.hpp"
#include "clearcore/replay/replay_driver.hpp"
#include "clearcore/report/csv_writer.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " <transactions.csv> [config_file]\n"
            << "  transactions.csv: transaction log with columns type,client,tx,amount\n"
            << "  config_file:      Path to TOML configuration file\n"
            << "                    If not specified, uses ./clearcore.toml or built-in defaults\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 2) {
    return std::filesystem::path{argv[2]};
  }

  const char* home = std::getenv("HOME");
  std::filesystem::path default_paths[] = {
      "./clearcore.toml",
      home ? std::filesystem::path{home} / ".config/clearcore/clearcore.toml" : std::filesystem::path{},
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

bool load_config(const std::filesystem::path& config_path, clearcore::config::ReplayConfig& cfg) {
  using clearcore::config::ConfigLoader;

  auto result = config_path.empty() ? ConfigLoader::load_from_string(ConfigLoader::generate_default())
                                    : ConfigLoader::load(config_path);
  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Parse error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
    }
    return false;
  }
  cfg = std::move(result.config);
  return true;
}

void print_telemetry(clearcore::replay::Driver& driver, const clearcore::replay::Driver::Summary& summary) {
  using namespace clearcore;

  std::cerr << "Replay summary: " << summary.lines << " lines, " << summary.decoded << " decoded, "
            << summary.rejected << " rejected, " << summary.applied << " applied, " << summary.ignored
            << " ignored\n";

  const auto counters = driver.telemetry().counters();
  for (std::size_t i = 0; i < engine::kOutcomeCount; ++i) {
    const auto outcome = static_cast<engine::Outcome>(i);
    if (auto it = counters.find(replay::outcome_metric(outcome)); it != counters.end()) {
      std::cerr << "  " << engine::to_string(outcome) << ": " << it->second << "\n";
    }
  }

  for (const auto& latency : driver.telemetry().drain_latency()) {
    const auto kind = static_cast<engine::TransactionKind>(latency.id - replay::kLatencyMetricBase);
    std::cerr << "  " << engine::to_string(kind) << " latency: n=" << latency.count
              << " mean=" << latency.mean_ns << "ns p99=" << latency.p99_ns << "ns\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace clearcore;

  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  config::ReplayConfig cfg;
  if (!load_config(find_config_path(argc, argv), cfg)) {
    return 1;
  }

  replay::Driver driver;
  driver.configure({
      .input = {.delimiter = cfg.input.delimiter,
                .has_header = cfg.input.has_header,
                .trim_whitespace = cfg.input.trim_whitespace},
      .telemetry_enabled = cfg.telemetry.enabled,
  });
  driver.set_error_handler([](const ingest::DecodeError& err) {
    std::cerr << "Application error: line " << err.line << ": " << err.message << "\n";
  });

  engine::TransactionEngine engine;

  try {
    const auto summary = driver.execute(std::filesystem::path{argv[1]}, engine);

    const auto accounts = engine.snapshot();
    report::write_accounts(std::cout, accounts,
                           {.delimiter = cfg.output.delimiter, .sort_by_client = cfg.output.sort_by_client});

    if (cfg.telemetry.enabled) {
      print_telemetry(driver, summary);
    }
  } catch (const std::exception& e) {
    std::cerr << "Application error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
