#include "svgraster_log.hpp"

#include <algorithm>
#include <mutex>
#include <sstream>

#include <spdlog/details/os.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    constexpr std::size_t kMaxLevelSettingLength = 512;

    std::once_flag                  g_loggerInitOnce;
    std::shared_ptr<spdlog::logger> g_logger;

    std::string Trimmed(const std::string& text)
    {
        const char*       spaces = " \n\r\t";
        const std::size_t first  = text.find_first_not_of(spaces);
        if (first == std::string::npos)
        {
            return std::string();
        }
        return text.substr(first, text.find_last_not_of(spaces) - first + 1);
    }

    std::string Lowered(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](char ch) { return static_cast<char>((ch >= 'A' && ch <= 'Z') ? ch + ('a' - 'A') : ch); });
        return text;
    }

    std::shared_ptr<spdlog::logger> CreateLogger()
    {
        if (auto existing = spdlog::get(svgraster::kLoggerName); existing != nullptr)
        {
            // The host registered its own sink for us; leave its level alone.
            return existing;
        }

        std::shared_ptr<spdlog::logger> logger;
        try
        {
            logger = spdlog::stderr_color_mt(svgraster::kLoggerName);
        }
        catch (const spdlog::spdlog_ex&)
        {
            // Lost a registration race with the host.
            logger = spdlog::get(svgraster::kLoggerName);
            if (logger != nullptr)
            {
                return logger;
            }
            logger = std::make_shared<spdlog::logger>(svgraster::kLoggerName,
                                                      std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }

        // Only our own logger reads SPDLOG_LEVEL; host loggers keep their levels.
        const std::string levels = spdlog::details::os::getenv("SPDLOG_LEVEL");
        logger->set_level(svgraster::LevelFromSetting(levels, spdlog::level::warn));
        return logger;
    }

} // namespace

namespace svgraster
{

    std::shared_ptr<spdlog::logger> Log()
    {
        std::call_once(g_loggerInitOnce, []() { g_logger = CreateLogger(); });
        return g_logger;
    }

    spdlog::level::level_enum LevelFromSetting(const std::string& setting, spdlog::level::level_enum fallback)
    {
        if (setting.empty() || setting.size() > kMaxLevelSettingLength)
        {
            return fallback;
        }

        bool                      hasGlobal = false;
        bool                      hasNamed  = false;
        spdlog::level::level_enum global    = fallback;
        spdlog::level::level_enum named     = fallback;

        std::istringstream entries(setting);
        std::string        entry;
        while (std::getline(entries, entry, ','))
        {
            // "name=level" targets one logger, a bare "level" targets all.
            const std::size_t separator = entry.find('=');
            const bool        bare      = separator == std::string::npos;
            const std::string name      = bare ? std::string() : Trimmed(entry.substr(0, separator));
            const std::string levelName = Lowered(Trimmed(bare ? entry : entry.substr(separator + 1)));

            const spdlog::level::level_enum level = spdlog::level::from_str(levelName);
            if (level == spdlog::level::off && levelName != "off")
            {
                continue;
            }

            if (name.empty())
            {
                hasGlobal = true;
                global    = level;
            }
            else if (name == kLoggerName)
            {
                hasNamed = true;
                named    = level;
            }
        }

        if (hasNamed)
        {
            return named;
        }
        return hasGlobal ? global : fallback;
    }

} // namespace svgraster
