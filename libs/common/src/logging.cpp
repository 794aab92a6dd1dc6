#include "settlecore/common/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace settlecore {
namespace common {

spdlog::level::level_enum parse_level(std::string_view level) {
  const auto parsed = spdlog::level::from_str(std::string(level));
  if (parsed == spdlog::level::off && level != "off") {
    return spdlog::level::info;
  }
  return parsed;
}

std::shared_ptr<spdlog::logger> init_logging(std::string_view level, std::string_view pattern) {
  auto logger = spdlog::get(std::string(kLoggerName));
  if (!logger) {
    logger = spdlog::stderr_color_mt(std::string(kLoggerName));
  }
  logger->set_level(parse_level(level));
  if (!pattern.empty()) {
    logger->set_pattern(std::string(pattern));
  }
  spdlog::set_default_logger(logger);
  return logger;
}

}  // namespace common
}  // namespace settlecore
