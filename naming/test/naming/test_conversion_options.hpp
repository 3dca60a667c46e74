#pragma once

#include <naming/conversion_options.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace Naming::Test
{
    class ConversionOptionsTests : public ::testing::Test
    {
      public:
        ConversionOptions load(char const* text) const
        {
            return nlohmann::json::parse(text).get<ConversionOptions>();
        }
    };

    TEST_F(ConversionOptionsTests, DefaultsConvertToSnakeFromAnything)
    {
        const ConversionOptions options{};
        EXPECT_FALSE(options.from.has_value());
        EXPECT_EQ(options.to, Convention::Snake);
        EXPECT_EQ(options.apply("XMLHttpRequest"), "xml_http_request");
    }

    TEST_F(ConversionOptionsTests, EmptyObjectKeepsDefaults)
    {
        const auto options = load("{}");
        EXPECT_FALSE(options.from.has_value());
        EXPECT_FALSE(options.boundaries.has_value());
        EXPECT_EQ(options.to, Convention::Snake);
    }

    TEST_F(ConversionOptionsTests, ConventionNamesMayBeWrittenInAnyStyle)
    {
        const auto options = load(R"({"from": "snake_case", "to": "SCREAMING-SNAKE"})");
        EXPECT_EQ(options.from, Convention::Snake);
        EXPECT_EQ(options.to, Convention::ScreamingSnake);
        EXPECT_EQ(options.apply("2020-04-16_my_cat"), "2020-04-16_MY_CAT");
    }

    TEST_F(ConversionOptionsTests, UnknownConventionThrows)
    {
        EXPECT_THROW(load(R"({"to": "hungarian"})"), std::invalid_argument);
    }

    TEST_F(ConversionOptionsTests, UnknownBoundaryThrows)
    {
        EXPECT_THROW(load(R"({"boundaries": ["Space", "Dot"]})"), std::invalid_argument);
    }

    TEST_F(ConversionOptionsTests, CustomBoundariesWin)
    {
        const auto options = load(R"({"from": "Kebab", "to": "Title", "boundaries": ["Underscore"]})");
        ASSERT_TRUE(options.boundaries.has_value());
        EXPECT_EQ(*options.boundaries, BoundarySet{Boundary::Underscore});
        EXPECT_EQ(options.apply("ninety-nine_problems"), "Ninety-nine Problems");
    }

    TEST_F(ConversionOptionsTests, SerializesOnlyWhatIsSet)
    {
        ConversionOptions options{};
        options.to = Convention::Camel;

        nlohmann::json j = options;
        EXPECT_EQ(j, nlohmann::json::parse(R"({"to": "Camel"})"));

        options.from = Convention::Kebab;
        options.boundaries = BoundarySet{Boundary::Hyphen, Boundary::AlphaNumeric};
        j = options;
        EXPECT_EQ(j, nlohmann::json::parse(R"({"from": "Kebab", "to": "Camel", "boundaries": ["Hyphen", "AlphaNumeric"]})"));

        const auto restored = j.get<ConversionOptions>();
        EXPECT_EQ(restored.from, options.from);
        EXPECT_EQ(restored.to, options.to);
        EXPECT_EQ(restored.boundaries, options.boundaries);
    }

    TEST_F(ConversionOptionsTests, UseDefaultsFromFillsUnsetFields)
    {
        ConversionOptions fallback{};
        fallback.from = Convention::Camel;
        fallback.boundaries = BoundarySet{Boundary::LowerUpper};

        ConversionOptions options{};
        options.from = Convention::Snake;
        options.to = Convention::Kebab;
        options.useDefaultsFrom(fallback);

        EXPECT_EQ(options.from, Convention::Snake);
        EXPECT_EQ(options.boundaries, BoundarySet{Boundary::LowerUpper});
        EXPECT_EQ(options.to, Convention::Kebab);
    }
}
