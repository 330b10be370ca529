#include <navpick/config/config_helpers.h>
#include <navpick/core/logging.h>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

namespace navpick::logging {

std::optional<spdlog::level::level_enum> parseLevel(std::string_view name) {
    const std::string v = config::toLower(config::trimmed(name));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

std::optional<spdlog::level::level_enum> applyLogLevelFromEnv() {
    const char* envLvl = std::getenv(kLogLevelEnv);
    if (!envLvl || !*envLvl) {
        return std::nullopt;
    }
    auto lvl = parseLevel(envLvl);
    if (!lvl) {
        spdlog::warn("[logging] Ignoring unknown {}='{}'", kLogLevelEnv, envLvl);
        return std::nullopt;
    }
    spdlog::set_level(*lvl);
    return lvl;
}

} // namespace navpick::logging
