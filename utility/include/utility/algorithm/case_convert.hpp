#pragma once

#include <algorithm>
#include <string>
#include <string_view>

namespace Utility::Algorithm
{
    constexpr bool isAsciiUpper(char c)
    {
        return c >= 'A' && c <= 'Z';
    }

    constexpr bool isAsciiLower(char c)
    {
        return c >= 'a' && c <= 'z';
    }

    constexpr bool isAsciiWhitespace(char32_t c)
    {
        return c == U' ' || c == U'\t' || c == U'\n' || c == U'\v' || c == U'\f' || c == U'\r';
    }

    constexpr char toAsciiLower(char c)
    {
        return isAsciiUpper(c) ? static_cast<char>(c - 'A' + 'a') : c;
    }

    inline bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs)
    {
        return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char l, char r) {
            return toAsciiLower(l) == toAsciiLower(r);
        });
    }

    // Unicode properties of single code points, independent of any locale.
    bool isUpperCase(char32_t c);
    bool isLowerCase(char32_t c);
    bool isCased(char32_t c);
    bool isAlphabetic(char32_t c);
    bool isNumeric(char32_t c);

    // Simple one to one mappings.
    char32_t toUpper(char32_t c);
    char32_t toLower(char32_t c);
    char32_t toTitle(char32_t c);

    /**
     * @brief Converts the passed UTF-8 string to upper case by out paramter.
     * Uses the full mappings without language specific rules, so "ß" becomes "SS".
     * Ill-formed bytes are left untouched.
     *
     * @param input The string to convert.
     */
    void toUpperCaseInplace(std::string& input);

    /**
     * @brief Converts the passed UTF-8 string to upper case and returns it.
     *
     * @param input The string to convert.
     * @return std::string The string in upper case.
     */
    std::string toUpperCase(std::string_view input);

    /**
     * @brief Converts the passed UTF-8 string to lower case by out paramter.
     * A final capital sigma becomes "ς".
     *
     * @param input The string to convert.
     */
    void toLowerCaseInplace(std::string& input);

    /**
     * @brief Converts the passed UTF-8 string to lower case and returns it.
     *
     * @param input The string to convert.
     * @return std::string The string in lower case.
     */
    std::string toLowerCase(std::string_view input);
}
