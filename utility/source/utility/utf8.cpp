#include <utility/utf8.hpp>

#include <unicode/utf8.h>

#include <algorithm>
#include <cstdint>

namespace Utility::Utf8
{
    CodePointAndLength decode(std::string_view text)
    {
        if (text.empty())
            return {U'\0', 0, false};

        const auto* bytes = reinterpret_cast<std::uint8_t const*>(text.data());
        const auto length = static_cast<std::int32_t>(std::min<std::size_t>(text.size(), U8_MAX_LENGTH));
        std::int32_t index = 0;
        UChar32 codePoint = 0;
        U8_NEXT(bytes, index, length, codePoint);

        if (codePoint < 0)
            return {U'\uFFFD', static_cast<std::size_t>(index), false};
        return {static_cast<char32_t>(codePoint), static_cast<std::size_t>(index), true};
    }

    bool isValid(std::string_view text)
    {
        bool valid = true;
        forEachCodePoint(text, [&valid](CodePointAndLength const& decoded, std::string_view) {
            valid = valid && decoded.valid;
        });
        return valid;
    }

    void append(std::string& out, char32_t codePoint)
    {
        std::uint8_t buffer[U8_MAX_LENGTH]{};
        std::int32_t length = 0;
        U8_APPEND_UNSAFE(buffer, length, static_cast<UChar32>(codePoint));
        out.append(reinterpret_cast<char const*>(buffer), static_cast<std::size_t>(length));
    }
}
