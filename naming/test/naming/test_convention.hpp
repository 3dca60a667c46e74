#pragma once

#include <naming/convention.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <set>

namespace Naming::Test
{
    class ConventionTests : public ::testing::Test
    {};

    TEST_F(ConventionTests, ConventionsAreListedInDeclarationOrder)
    {
        const auto all = conventions();
        ASSERT_EQ(all.size(), 13u);
        EXPECT_EQ(all.front(), Convention::Upper);
        EXPECT_EQ(all[6], Convention::UpperCamel);
        EXPECT_EQ(all.back(), Convention::Alternating);
        EXPECT_EQ(std::set<Convention>(all.begin(), all.end()).size(), all.size());
    }

    TEST_F(ConventionTests, EveryConventionHasItsOwnTraits)
    {
        for (auto convention : conventions())
        {
            auto const& traits = conventionTraits(convention);
            EXPECT_EQ(traits.convention, convention) << conventionName(convention);
            EXPECT_FALSE(traits.boundaries.empty()) << conventionName(convention);
        }
    }

    TEST_F(ConventionTests, DelimiterConventionsSplitOnlyOnTheirDelimiter)
    {
        EXPECT_EQ(conventionTraits(Convention::Snake).boundaries, BoundarySet{Boundary::Underscore});
        EXPECT_EQ(conventionTraits(Convention::ScreamingSnake).boundaries, BoundarySet{Boundary::Underscore});
        EXPECT_EQ(conventionTraits(Convention::Kebab).boundaries, BoundarySet{Boundary::Hyphen});
        EXPECT_EQ(conventionTraits(Convention::Cobol).boundaries, BoundarySet{Boundary::Hyphen});
        EXPECT_EQ(conventionTraits(Convention::Train).boundaries, BoundarySet{Boundary::Hyphen});
        EXPECT_EQ(conventionTraits(Convention::Title).boundaries, BoundarySet{Boundary::Space});
        EXPECT_EQ(conventionTraits(Convention::Alternating).boundaries, BoundarySet{Boundary::Space});
    }

    TEST_F(ConventionTests, CompactConventionsSplitOnCaseAndDigits)
    {
        const BoundarySet compact{Boundary::LowerUpper, Boundary::Acronym, Boundary::AlphaNumeric};
        EXPECT_EQ(conventionTraits(Convention::Camel).boundaries, compact);
        EXPECT_EQ(conventionTraits(Convention::Pascal).boundaries, compact);
        EXPECT_EQ(conventionTraits(Convention::UpperCamel).boundaries, compact);
        EXPECT_EQ(conventionTraits(Convention::Camel).delimiter, "");
    }

    TEST_F(ConventionTests, NamesAreStable)
    {
        EXPECT_EQ(conventionName(Convention::ScreamingSnake), "ScreamingSnake");
        EXPECT_EQ(conventionName(Convention::UpperCamel), "UpperCamel");
        for (auto convention : conventions())
            EXPECT_EQ(parseConvention(conventionName(convention)).value(), convention);
    }

    TEST_F(ConventionTests, NamesParseInAnyStyle)
    {
        EXPECT_EQ(parseConvention("screaming_snake").value(), Convention::ScreamingSnake);
        EXPECT_EQ(parseConvention("SCREAMING-SNAKE-CASE").value(), Convention::ScreamingSnake);
        EXPECT_EQ(parseConvention("screamingSnakeCase").value(), Convention::ScreamingSnake);
        EXPECT_EQ(parseConvention("upper camel case").value(), Convention::UpperCamel);
        EXPECT_EQ(parseConvention("snake_case").value(), Convention::Snake);
        EXPECT_EQ(parseConvention("UPPER").value(), Convention::Upper);
    }

    TEST_F(ConventionTests, UnknownNamesAreReportedNotThrown)
    {
        const auto result = parseConvention("hungarian");
        ASSERT_FALSE(result.has_value());
        EXPECT_THAT(result.error(), ::testing::HasSubstr("hungarian"));

        EXPECT_FALSE(parseConvention("").has_value());
        EXPECT_FALSE(parseConvention("case").has_value());
        EXPECT_FALSE(parseConvention("snake snake").has_value());
    }

    TEST_F(ConventionTests, BoundarySetOperations)
    {
        const auto set = BoundarySet::none().with(Boundary::Acronym).with(Boundary::Space);
        EXPECT_TRUE(set.contains(Boundary::Acronym));
        EXPECT_FALSE(set.contains(Boundary::Hyphen));
        EXPECT_THAT(set.boundaries(), ::testing::ElementsAre(Boundary::Space, Boundary::Acronym));
        EXPECT_TRUE(set.without(Boundary::Space).without(Boundary::Acronym).empty());
        EXPECT_EQ(BoundarySet::all().boundaries().size(), 6u);
        EXPECT_TRUE(BoundarySet::all().consumes('\t'));
        EXPECT_FALSE(BoundarySet{Boundary::Hyphen}.consumes('_'));
    }
}
