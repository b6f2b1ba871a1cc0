#include "test_config.hpp"

#include <cassert>
#include <filesystem>
#include "clearcore/config/config_loader.hpp"

namespace clearcore::tests {

void test_config_defaults() {
  const auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
  assert(result.success);
  assert(result.config.input.delimiter == ',');
  assert(result.config.input.has_header);
  assert(result.config.input.trim_whitespace);
  assert(result.config.output.delimiter == ',');
  assert(!result.config.output.sort_by_client);
  assert(result.config.telemetry.enabled);

  // Missing sections fall back to defaults.
  const auto empty = config::ConfigLoader::load_from_string("");
  assert(empty.success);
  assert(empty.config.input.has_header);
}

void test_config_overrides() {
  const auto result = config::ConfigLoader::load_from_string(R"(
[input]
delimiter = ";"
has_header = false

[output]
delimiter = "|"
sort_by_client = true

[telemetry]
enabled = false
)");
  assert(result.success);
  assert(result.config.input.delimiter == ';');
  assert(!result.config.input.has_header);
  assert(result.config.input.trim_whitespace);
  assert(result.config.output.delimiter == '|');
  assert(result.config.output.sort_by_client);
  assert(!result.config.telemetry.enabled);
}

void test_config_validation() {
  const auto multi_char = config::ConfigLoader::load_from_string("[input]\ndelimiter = \"::\"\n");
  assert(!multi_char.success);
  assert(multi_char.errors.size() == 1);
  assert(multi_char.errors.front().field == "input.delimiter");

  const auto reserved = config::ConfigLoader::load_from_string("[output]\ndelimiter = \".\"\n");
  assert(!reserved.success);
  assert(reserved.errors.front().field == "output.delimiter");

  const auto malformed = config::ConfigLoader::load_from_string("[input\n");
  assert(!malformed.success);
  assert(!malformed.raw_error.empty());

  const auto missing = config::ConfigLoader::load(std::filesystem::temp_directory_path() / "clearcore_missing.toml");
  assert(!missing.success);
  assert(missing.raw_error.find("not found") != std::string::npos);
}

}  // namespace clearcore::tests
