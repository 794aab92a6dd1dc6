#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace settlecore {
namespace common {

inline constexpr std::string_view kLoggerName = "settlecore";

// Installs the stderr logger as spdlog's default. stdout is reserved for the
// account report.
std::shared_ptr<spdlog::logger> init_logging(std::string_view level, std::string_view pattern);

// Accepts spdlog level names ("trace" ... "off"); falls back to info.
spdlog::level::level_enum parse_level(std::string_view level);

}  // namespace common
}  // namespace settlecore
