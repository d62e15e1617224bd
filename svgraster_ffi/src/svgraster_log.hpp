#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace svgraster
{

    constexpr const char* kLoggerName = "svgraster";

    // Process-wide "svgraster" logger. Defaults to warn; SPDLOG_LEVEL overrides it.
    std::shared_ptr<spdlog::logger> Log();

    // Level an SPDLOG_LEVEL style string ("info", "svgraster=debug,net=off")
    // selects for the "svgraster" logger. A named entry wins over a bare
    // level; unknown level names are ignored.
    spdlog::level::level_enum LevelFromSetting(const std::string& setting, spdlog::level::level_enum fallback);

} // namespace svgraster
