#pragma once

#include <spdlog/common.h>

#include <utility/algorithm/case_convert.hpp>

#include <array>
#include <string>
#include <string_view>
#include <utility>

namespace Log
{
    enum class Level
    {
        Trace,
        Debug,
        Info,
        Warning,
        Error,
        Critical,
        Off
    };

    namespace Detail
    {
        inline constexpr std::array<std::pair<Level, std::string_view>, 7> levelNames{{
            {Level::Trace, "trace"},
            {Level::Debug, "debug"},
            {Level::Info, "info"},
            {Level::Warning, "warning"},
            {Level::Error, "error"},
            {Level::Critical, "critical"},
            {Level::Off, "off"},
        }};
    }

    inline spdlog::level::level_enum toSpdlogLevel(Level lvl)
    {
        switch (lvl)
        {
            case Level::Trace:
                return spdlog::level::trace;
            case Level::Debug:
                return spdlog::level::debug;
            case Level::Info:
                return spdlog::level::info;
            case Level::Warning:
                return spdlog::level::warn;
            case Level::Error:
                return spdlog::level::err;
            case Level::Critical:
                return spdlog::level::critical;
            case Level::Off:
                return spdlog::level::off;
        }
        return spdlog::level::info;
    }

    inline Level fromSpdlogLevel(spdlog::level::level_enum lvl)
    {
        switch (lvl)
        {
            case spdlog::level::trace:
                return Level::Trace;
            case spdlog::level::debug:
                return Level::Debug;
            case spdlog::level::info:
                return Level::Info;
            case spdlog::level::warn:
                return Level::Warning;
            case spdlog::level::err:
                return Level::Error;
            case spdlog::level::critical:
                return Level::Critical;
            case spdlog::level::off:
                return Level::Off;
            default:
                return Level::Info;
        }
    }

    /**
     * @brief Parses a level name case insensitively. "warn" is accepted as well.
     * Unknown names yield Level::Info.
     */
    inline Level levelFromString(std::string_view str)
    {
        if (Utility::Algorithm::equalsIgnoreCase(str, "warn"))
            return Level::Warning;

        for (auto const& [level, name] : Detail::levelNames)
        {
            if (Utility::Algorithm::equalsIgnoreCase(str, name))
                return level;
        }
        return Level::Info;
    }

    inline std::string levelToString(Level lvl)
    {
        for (auto const& [level, name] : Detail::levelNames)
        {
            if (level == lvl)
                return std::string{name};
        }
        return "info";
    }
}
