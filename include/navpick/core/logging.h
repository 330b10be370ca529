#pragma once

#include <spdlog/common.h>

#include <optional>
#include <string_view>

namespace navpick::logging {

inline constexpr const char* kLogLevelEnv = "NAVPICK_LOG_LEVEL";

// trace|debug|info|warn|error|critical|off (case-insensitive, common aliases accepted)
std::optional<spdlog::level::level_enum> parseLevel(std::string_view name);

/**
 * Apply NAVPICK_LOG_LEVEL to the default spdlog logger.
 * Returns the level applied, or nullopt when the variable is unset or unrecognized
 * (the current level is kept).
 */
std::optional<spdlog::level::level_enum> applyLogLevelFromEnv();

} // namespace navpick::logging
