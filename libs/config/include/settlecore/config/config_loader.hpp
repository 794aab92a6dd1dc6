#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace settlecore {
namespace config {

struct EngineSection {
  std::size_t queue_depth{128};
};

struct LoggingSection {
  std::string level{"info"};
  std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v"};
};

struct TelemetrySection {
  bool enabled{true};
};

struct AppConfig {
  EngineSection engine;
  LoggingSection logging;
  TelemetrySection telemetry;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  AppConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const AppConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace settlecore
