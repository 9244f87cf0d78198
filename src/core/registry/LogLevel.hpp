#pragma once
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace pcr {

// Level named by PCR_LOG_LEVEL, or nullopt when the name is not a spdlog level.
std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name);

} // namespace pcr
