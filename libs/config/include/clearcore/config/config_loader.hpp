#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace clearcore {
namespace config {

struct InputConfig {
  char delimiter{','};
  bool has_header{true};
  bool trim_whitespace{true};
};

struct OutputConfig {
  char delimiter{','};
  bool sort_by_client{false};
};

struct TelemetryConfig {
  bool enabled{true};
};

struct ReplayConfig {
  InputConfig input;
  OutputConfig output;
  TelemetryConfig telemetry;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  ReplayConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const ReplayConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace clearcore
