#include "LogLevel.hpp"

namespace pcr {

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name) {
  auto level = spdlog::level::from_str(name);
  // from_str answers "off" for anything it does not recognize
  if (level == spdlog::level::off && name != "off") return std::nullopt;
  return level;
}

} // namespace pcr
