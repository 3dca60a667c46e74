#pragma once

#include <utility/describe.hpp>

#include <string>
#include <vector>

namespace Naming
{
    /**
     * @brief How the letters of a word sequence are cased. Letters are mapped by their Unicode case properties,
     * without language specific rules.
     *
     * Lowercase: every letter lowercase.
     * Uppercase: every letter uppercase.
     * Capital: first code point titlecase, rest lowercase.
     * Camel: first word lowercase, all following words Capital.
     * Toggle: first code point lowercase, rest uppercase.
     * Alternating: lowercase, uppercase, lowercase... counted over the cased letters of the whole sequence.
     */
    BOOST_DEFINE_ENUM_CLASS(Pattern, Lowercase, Uppercase, Capital, Camel, Toggle, Alternating)

    std::vector<std::string> applyPattern(std::vector<std::string> words, Pattern pattern);
}
