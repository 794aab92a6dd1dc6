#include "settlecore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <array>
#include <cstdint>
#include <sstream>

namespace settlecore {
namespace config {

namespace {

constexpr std::array<std::string_view, 7> kLogLevels{"trace", "debug", "info", "warn", "error", "critical", "off"};

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

EngineSection parse_engine(const toml::table& root) {
  EngineSection cfg;
  if (auto* engine = root["engine"].as_table()) {
    const auto depth = get_int_or(*engine, "queue_depth", static_cast<std::int64_t>(cfg.queue_depth));
    // Negative depths are mapped to 0 so validation reports them.
    cfg.queue_depth = depth < 0 ? 0 : static_cast<std::size_t>(depth);
  }
  return cfg;
}

LoggingSection parse_logging(const toml::table& root) {
  LoggingSection cfg;
  if (auto* logging = root["logging"].as_table()) {
    cfg.level = get_str_or(*logging, "level", cfg.level);
    cfg.pattern = get_str_or(*logging, "pattern", cfg.pattern);
  }
  return cfg;
}

TelemetrySection parse_telemetry(const toml::table& root) {
  TelemetrySection cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    if (auto val = (*telemetry)["enabled"].value<bool>()) {
      cfg.enabled = *val;
    }
  }
  return cfg;
}

AppConfig parse_config(const toml::table& root) {
  AppConfig cfg;
  cfg.engine = parse_engine(root);
  cfg.logging = parse_logging(root);
  cfg.telemetry = parse_telemetry(root);
  return cfg;
}

LoadResult finish(toml::parse_result&& parse_result) {
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
  return finish(toml::parse_file(path.string()));
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  return finish(toml::parse(toml_content));
}

std::vector<ValidationError> ConfigLoader::validate(const AppConfig& config) {
  std::vector<ValidationError> errors;

  const auto depth = config.engine.queue_depth;
  if (depth < 2 || (depth & (depth - 1)) != 0) {
    errors.push_back({"engine.queue_depth", "must be a power of two and at least 2"});
  }

  bool known_level = false;
  for (const auto level : kLogLevels) {
    known_level = known_level || config.logging.level == level;
  }
  if (!known_level) {
    errors.push_back({"logging.level", "must be one of trace, debug, info, warn, error, critical, off"});
  }

  if (config.logging.pattern.empty()) {
    errors.push_back({"logging.pattern", "pattern cannot be empty"});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# settlecore configuration
# Generated default configuration

[engine]
queue_depth = 128  # bounded ingest channel, power of two

[logging]
level = "info"
pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v"

[telemetry]
enabled = true
)";
}

}  // namespace config
}  // namespace settlecore
