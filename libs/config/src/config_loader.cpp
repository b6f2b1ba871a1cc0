#include "clearcore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <sstream>

namespace clearcore {
namespace config {

namespace {

// Delimiters are stored as a single char; anything else is caught by validate().
constexpr char kInvalidDelimiter = '\0';

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

char get_delimiter_or(const toml::table& tbl, std::string_view key, char default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return val->size() == 1 ? val->front() : kInvalidDelimiter;
  }
  return default_val;
}

InputConfig parse_input(const toml::table& root) {
  InputConfig cfg;
  if (auto* input = root["input"].as_table()) {
    cfg.delimiter = get_delimiter_or(*input, "delimiter", cfg.delimiter);
    cfg.has_header = get_bool_or(*input, "has_header", cfg.has_header);
    cfg.trim_whitespace = get_bool_or(*input, "trim_whitespace", cfg.trim_whitespace);
  }
  return cfg;
}

OutputConfig parse_output(const toml::table& root) {
  OutputConfig cfg;
  if (auto* output = root["output"].as_table()) {
    cfg.delimiter = get_delimiter_or(*output, "delimiter", cfg.delimiter);
    cfg.sort_by_client = get_bool_or(*output, "sort_by_client", cfg.sort_by_client);
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    cfg.enabled = get_bool_or(*telemetry, "enabled", cfg.enabled);
  }
  return cfg;
}

ReplayConfig parse_config(const toml::table& root) {
  ReplayConfig cfg;
  cfg.input = parse_input(root);
  cfg.output = parse_output(root);
  cfg.telemetry = parse_telemetry(root);
  return cfg;
}

void check_delimiter(char delimiter, const std::string& field, std::vector<ValidationError>& errors) {
  if (delimiter == kInvalidDelimiter) {
    errors.push_back({field, "delimiter must be exactly one character"});
    return;
  }
  const bool is_digit = delimiter >= '0' && delimiter <= '9';
  const std::string_view reserved = " \t\r\n.-+\"";
  if (is_digit || reserved.find(delimiter) != std::string_view::npos) {
    errors.push_back({field, "delimiter collides with field contents"});
  }
}

LoadResult finish(toml::parse_result& parse_result) {
  LoadResult result;
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = ConfigLoader::validate(result.config);
  result.success = result.errors.empty();
  return result;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    LoadResult result;
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  return finish(parse_result);
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  auto parse_result = toml::parse(toml_content);
  return finish(parse_result);
}

std::vector<ValidationError> ConfigLoader::validate(const ReplayConfig& config) {
  std::vector<ValidationError> errors;
  check_delimiter(config.input.delimiter, "input.delimiter", errors);
  check_delimiter(config.output.delimiter, "output.delimiter", errors);
  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# ClearCore replay configuration
# Generated default configuration

[input]
delimiter = ","
has_header = true
trim_whitespace = true

[output]
delimiter = ","
sort_by_client = false

[telemetry]
enabled = true
)";
}

}  // namespace config
}  // namespace clearcore
