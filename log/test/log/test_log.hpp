#pragma once

#include <log/log.hpp>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <memory>
#include <sstream>
#include <string>

namespace Log::Test
{
    using ::testing::HasSubstr;
    using ::testing::IsEmpty;
    using ::testing::Not;

    class LogTests : public ::testing::Test
    {
      public:
        void SetUp() override
        {
            auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(output_);
            sink->set_pattern("%l: %v");
            Log::setupLogger(std::make_shared<spdlog::logger>("test", std::move(sink)));
            Log::setLevel(Log::Level::Info);
        }

        void TearDown() override
        {
            Log::setupLogger(nullptr);
        }

      protected:
        std::ostringstream output_;
    };

    TEST_F(LogTests, LevelNamesRoundTrip)
    {
        for (auto level :
             {Level::Trace, Level::Debug, Level::Info, Level::Warning, Level::Error, Level::Critical, Level::Off})
        {
            EXPECT_EQ(levelFromString(levelToString(level)), level);
        }
    }

    TEST_F(LogTests, LevelNamesAreParsedLeniently)
    {
        EXPECT_EQ(levelFromString("DEBUG"), Level::Debug);
        EXPECT_EQ(levelFromString("warn"), Level::Warning);
        EXPECT_EQ(levelFromString("nonsense"), Level::Info);
    }

    TEST_F(LogTests, MapsToSpdlogLevels)
    {
        EXPECT_EQ(toSpdlogLevel(Level::Warning), spdlog::level::warn);
        EXPECT_EQ(fromSpdlogLevel(spdlog::level::err), Level::Error);
    }

    TEST_F(LogTests, FormatsMessages)
    {
        Log::log(Level::Info, "converted {} words to {}", 3, "Snake");
        EXPECT_THAT(output_.str(), HasSubstr("info: converted 3 words to Snake"));
    }

    TEST_F(LogTests, MessagesBelowTheLevelAreDropped)
    {
        Log::debug("hidden {}", 1);
        Log::trace("hidden {}", 2);
        EXPECT_THAT(output_.str(), IsEmpty());

        Log::setLevel(Level::Trace);
        EXPECT_EQ(Log::level(), Level::Trace);
        Log::trace("shown {}", 3);
        EXPECT_THAT(output_.str(), HasSubstr("shown 3"));
    }

    TEST_F(LogTests, OffSilencesEverything)
    {
        Log::setLevel(Level::Off);
        Log::warn("nothing");
        Log::log(Level::Off, "nothing either");
        EXPECT_THAT(output_.str(), Not(HasSubstr("nothing")));
    }

    TEST_F(LogTests, LevelSurvivesInstallingAnotherLogger)
    {
        Log::setLevel(Level::Debug);

        std::ostringstream replacement;
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(replacement);
        sink->set_pattern("%l: %v");
        auto logger = std::make_shared<spdlog::logger>("replacement", std::move(sink));
        logger->set_level(spdlog::level::err);
        Log::setupLogger(logger);

        EXPECT_EQ(Log::level(), Level::Debug);
        EXPECT_EQ(logger->level(), spdlog::level::debug);
        Log::debug("carried {}", 4);
        EXPECT_THAT(replacement.str(), HasSubstr("debug: carried 4"));
        EXPECT_THAT(output_.str(), IsEmpty());
    }

    TEST_F(LogTests, DisabledLevelsAreRejectedByTheFacade)
    {
        Log::setLevel(Level::Warning);
        EXPECT_FALSE(Detail::logger.shouldLog(Level::Info));
        EXPECT_TRUE(Detail::logger.shouldLog(Level::Error));
        EXPECT_FALSE(Detail::logger.shouldLog(Level::Off));
    }
}
