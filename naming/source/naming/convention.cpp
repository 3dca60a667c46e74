#include <naming/convention.hpp>
#include <naming/segmented_string.hpp>

#include <log/log.hpp>
#include <utility/algorithm/case_convert.hpp>

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace Naming
{
    namespace
    {
        constexpr BoundarySet spaceBoundaries{Boundary::Space};
        constexpr BoundarySet underscoreBoundaries{Boundary::Underscore};
        constexpr BoundarySet hyphenBoundaries{Boundary::Hyphen};
        constexpr BoundarySet compactBoundaries{Boundary::LowerUpper, Boundary::Acronym, Boundary::AlphaNumeric};

        constexpr std::array<ConventionTraits, Utility::enumCount<Convention>> traitsTable{{
            {Convention::Upper, " ", Pattern::Uppercase, spaceBoundaries},
            {Convention::Lower, " ", Pattern::Lowercase, spaceBoundaries},
            {Convention::Title, " ", Pattern::Capital, spaceBoundaries},
            {Convention::Toggle, " ", Pattern::Toggle, spaceBoundaries},
            {Convention::Camel, "", Pattern::Camel, compactBoundaries},
            {Convention::Pascal, "", Pattern::Capital, compactBoundaries},
            {Convention::UpperCamel, "", Pattern::Capital, compactBoundaries},
            {Convention::Snake, "_", Pattern::Lowercase, underscoreBoundaries},
            {Convention::ScreamingSnake, "_", Pattern::Uppercase, underscoreBoundaries},
            {Convention::Kebab, "-", Pattern::Lowercase, hyphenBoundaries},
            {Convention::Cobol, "-", Pattern::Uppercase, hyphenBoundaries},
            {Convention::Train, "-", Pattern::Capital, hyphenBoundaries},
            {Convention::Alternating, " ", Pattern::Alternating, spaceBoundaries},
        }};

        constexpr bool tableMatchesEnumeration()
        {
            const auto values = Utility::enumValues<Convention>();
            for (std::size_t i = 0; i < values.size(); ++i)
            {
                if (traitsTable[i].convention != values[i] || static_cast<std::size_t>(values[i]) != i)
                    return false;
            }
            return true;
        }
        static_assert(tableMatchesEnumeration(), "every convention needs its row, in declaration order");

        std::vector<std::string> nameWords(std::string_view name)
        {
            auto words = segment(name, BoundarySet::all());
            for (auto& word : words)
                Utility::Algorithm::toLowerCaseInplace(word);
            if (words.size() > 1 && words.back() == "case")
                words.pop_back();
            return words;
        }
    }

    ConventionTraits const& conventionTraits(Convention convention)
    {
        return traitsTable[static_cast<std::size_t>(convention)];
    }

    std::string conventionName(Convention convention)
    {
        return Utility::enumToString<Convention>(convention);
    }

    Utility::Expected<Convention, std::string> parseConvention(std::string_view name)
    {
        const auto wanted = nameWords(name);
        if (!wanted.empty())
        {
            for (auto convention : conventions())
            {
                if (nameWords(conventionName(convention)) == wanted)
                    return convention;
            }
        }
        return Utility::makeUnexpected("Unknown naming convention: '" + std::string{name} + "'");
    }

    void to_json(nlohmann::json& j, Convention const& convention)
    {
        j = conventionName(convention);
    }
    void from_json(nlohmann::json const& j, Convention& convention)
    {
        const auto parsed = parseConvention(j.get<std::string>());
        if (!parsed)
        {
            Log::warn("{}", parsed.error());
            throw std::invalid_argument(parsed.error());
        }
        convention = *parsed;
    }
}
