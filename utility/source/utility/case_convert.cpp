#include <utility/algorithm/case_convert.hpp>
#include <utility/utf8.hpp>

#include <unicode/locid.h>
#include <unicode/stringpiece.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

#include <cstdint>

namespace Utility::Algorithm
{
    namespace
    {
        template <typename MapT>
        std::string mapEachCodePoint(std::string_view input, MapT const& map)
        {
            std::string result{};
            result.reserve(input.size());
            Utf8::forEachCodePoint(input, [&result, &map](Utf8::CodePointAndLength const& decoded, std::string_view bytes) {
                if (decoded.valid)
                    Utf8::append(result, map(decoded.codePoint));
                else
                    result.append(bytes);
            });
            return result;
        }

        template <typename ConvertT, typename MapT>
        std::string convertCase(std::string_view input, ConvertT const& convert, MapT const& fallback)
        {
            // icu replaces ill-formed bytes, so those strings are mapped one code point at a time.
            if (!Utf8::isValid(input))
                return mapEachCodePoint(input, fallback);

            auto text = icu::UnicodeString::fromUTF8(icu::StringPiece{input.data(), static_cast<std::int32_t>(input.size())});
            convert(text);
            std::string result{};
            text.toUTF8String(result);
            return result;
        }
    }

    bool isUpperCase(char32_t c)
    {
        return u_isUUppercase(static_cast<UChar32>(c));
    }

    bool isLowerCase(char32_t c)
    {
        return u_isULowercase(static_cast<UChar32>(c));
    }

    bool isCased(char32_t c)
    {
        return u_hasBinaryProperty(static_cast<UChar32>(c), UCHAR_CASED);
    }

    bool isAlphabetic(char32_t c)
    {
        return u_isUAlphabetic(static_cast<UChar32>(c));
    }

    bool isNumeric(char32_t c)
    {
        return u_getIntPropertyValue(static_cast<UChar32>(c), UCHAR_NUMERIC_TYPE) != U_NT_NONE;
    }

    char32_t toUpper(char32_t c)
    {
        return static_cast<char32_t>(u_toupper(static_cast<UChar32>(c)));
    }

    char32_t toLower(char32_t c)
    {
        return static_cast<char32_t>(u_tolower(static_cast<UChar32>(c)));
    }

    char32_t toTitle(char32_t c)
    {
        return static_cast<char32_t>(u_totitle(static_cast<UChar32>(c)));
    }

    void toUpperCaseInplace(std::string& input)
    {
        input = toUpperCase(input);
    }

    std::string toUpperCase(std::string_view input)
    {
        return convertCase(
            input,
            [](icu::UnicodeString& text) {
                text.toUpper(icu::Locale::getRoot());
            },
            toUpper);
    }

    void toLowerCaseInplace(std::string& input)
    {
        input = toLowerCase(input);
    }

    std::string toLowerCase(std::string_view input)
    {
        return convertCase(
            input,
            [](icu::UnicodeString& text) {
                text.toLower(icu::Locale::getRoot());
            },
            toLower);
    }
}
