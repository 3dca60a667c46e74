#pragma once

#include <naming/boundary.hpp>
#include <naming/pattern.hpp>
#include <utility/describe.hpp>
#include <utility/enum_string_convert.hpp>
#include <utility/expected.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <string>
#include <string_view>

namespace Naming
{
    /**
     * @brief The naming conventions text can be converted to and from.
     *
     * | Convention     | Example               |
     * |----------------|-----------------------|
     * | Upper          | MY VARIABLE 22 NAME   |
     * | Lower          | my variable 22 name   |
     * | Title          | My Variable 22 Name   |
     * | Toggle         | mY vARIABLE 22 nAME   |
     * | Camel          | myVariable22Name      |
     * | Pascal         | MyVariable22Name      |
     * | UpperCamel     | MyVariable22Name      |
     * | Snake          | my_variable_22_name   |
     * | ScreamingSnake | MY_VARIABLE_22_NAME   |
     * | Kebab          | my-variable-22-name   |
     * | Cobol          | MY-VARIABLE-22-NAME   |
     * | Train          | My-Variable-22-Name   |
     * | Alternating    | mY vArIaBlE 22 nAmE   |
     */
    BOOST_DEFINE_ENUM_CLASS(
        Convention,
        Upper,
        Lower,
        Title,
        Toggle,
        Camel,
        Pascal,
        UpperCamel,
        Snake,
        ScreamingSnake,
        Kebab,
        Cobol,
        Train,
        Alternating)

    struct ConventionTraits
    {
        Convention convention;
        std::string_view delimiter;
        Pattern pattern;
        // Boundaries used to split text that is known to be in this convention.
        BoundarySet boundaries;
    };

    ConventionTraits const& conventionTraits(Convention convention);

    constexpr std::array<Convention, Utility::enumCount<Convention>> conventions()
    {
        return Utility::enumValues<Convention>();
    }

    std::string conventionName(Convention convention);

    /**
     * @brief Looks up a convention by name regardless of how the name itself is written.
     * "ScreamingSnake", "screaming_snake", "SCREAMING-SNAKE-CASE" and "screamingSnakeCase" all
     * yield Convention::ScreamingSnake. A trailing "case" word is ignored.
     *
     * @param name The name to look up.
     * @return Utility::Expected<Convention, std::string> The convention or a message naming the unknown input.
     */
    Utility::Expected<Convention, std::string> parseConvention(std::string_view name);

    void to_json(nlohmann::json& j, Convention const& convention);
    void from_json(nlohmann::json const& j, Convention& convention);
}
