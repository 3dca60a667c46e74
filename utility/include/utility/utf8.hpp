#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace Utility::Utf8
{
    struct CodePointAndLength
    {
        char32_t codePoint;
        // Number of bytes consumed, at least 1 unless the input was empty.
        std::size_t length;
        // False for an ill-formed sequence. codePoint is then meaningless and the bytes must be kept as they are.
        bool valid;
    };

    /**
     * @brief Decodes the code point at the front of text.
     */
    CodePointAndLength decode(std::string_view text);

    bool isValid(std::string_view text);

    void append(std::string& out, char32_t codePoint);

    /**
     * @brief Calls fn(CodePointAndLength, std::string_view bytes) for every code point of text, in order.
     */
    template <typename FunctionT>
    void forEachCodePoint(std::string_view text, FunctionT&& fn)
    {
        while (!text.empty())
        {
            const auto decoded = decode(text);
            fn(decoded, text.substr(0, decoded.length));
            text.remove_prefix(decoded.length);
        }
    }
}
