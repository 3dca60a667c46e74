#pragma once

#include <log/level.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace Log
{
    /**
     * @brief Forwards to an installed spdlog logger, or to the spdlog default logger
     * if none is installed.
     *
     * The level lives here and not in the spdlog logger. Disabled messages are rejected
     * without taking a lock, and the level survives installing another logger.
     */
    class Logger
    {
      public:
        Logger()
            : guard_{}
            , logger_{nullptr}
            , level_{Log::Level::Info}
        {}

        void setup(std::shared_ptr<spdlog::logger> logger)
        {
            {
                std::scoped_lock lock{guard_};
                logger_ = std::move(logger);
            }
            target()->set_level(toSpdlogLevel(level_.load(std::memory_order_relaxed)));
        }

        void setLevel(Log::Level level)
        {
            level_.store(level, std::memory_order_relaxed);
            target()->set_level(toSpdlogLevel(level));
        }

        Log::Level level() const
        {
            return level_.load(std::memory_order_relaxed);
        }

        bool shouldLog(Log::Level level) const
        {
            return level != Log::Level::Off && level >= level_.load(std::memory_order_relaxed);
        }

        template <typename... Args>
        void log(Log::Level level, std::string_view fmt, Args&&... args)
        {
            if (!shouldLog(level))
                return;

            const std::string buf = spdlog::fmt_lib::format(spdlog::fmt_lib::runtime(fmt), std::forward<Args>(args)...);
            logImpl(level, buf);
        }

        void logImpl(Log::Level level, std::string const& msg)
        {
            auto logger = target();
            logger->log(toSpdlogLevel(level), msg);
        }

      private:
        std::shared_ptr<spdlog::logger> target() const
        {
            std::scoped_lock lock{guard_};
            if (logger_)
                return logger_;
            return spdlog::default_logger();
        }

      private:
        mutable std::mutex guard_;
        std::shared_ptr<spdlog::logger> logger_;
        std::atomic<Log::Level> level_;
    };
}
