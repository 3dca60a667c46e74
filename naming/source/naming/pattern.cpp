#include <naming/pattern.hpp>

#include <utility/algorithm/case_convert.hpp>
#include <utility/utf8.hpp>

#include <cstddef>
#include <string_view>
#include <utility>

using namespace Utility::Algorithm;

namespace Naming
{
    namespace
    {
        // Maps the first code point of word and converts the rest as a whole.
        template <typename FirstT, typename RestT>
        void transformFirstAndRest(std::string& word, FirstT first, RestT const& rest)
        {
            if (word.empty())
                return;

            const auto decoded = Utility::Utf8::decode(word);
            std::string result{};
            if (decoded.valid)
                Utility::Utf8::append(result, first(decoded.codePoint));
            else
                result.append(word, 0, decoded.length);
            result += rest(std::string_view{word}.substr(decoded.length));
            word = std::move(result);
        }

        void capitalize(std::string& word)
        {
            transformFirstAndRest(word, toTitle, [](std::string_view rest) {
                return toLowerCase(rest);
            });
        }

        void toggle(std::string& word)
        {
            transformFirstAndRest(word, toLower, [](std::string_view rest) {
                return toUpperCase(rest);
            });
        }

        void alternate(std::vector<std::string>& words)
        {
            bool upper = false;
            for (auto& word : words)
            {
                std::string result{};
                Utility::Utf8::forEachCodePoint(
                    word, [&upper, &result](Utility::Utf8::CodePointAndLength const& decoded, std::string_view bytes) {
                        if (!decoded.valid || !isCased(decoded.codePoint))
                        {
                            result.append(bytes);
                            return;
                        }
                        Utility::Utf8::append(result, upper ? toUpper(decoded.codePoint) : toLower(decoded.codePoint));
                        upper = !upper;
                    });
                word = std::move(result);
            }
        }
    }

    std::vector<std::string> applyPattern(std::vector<std::string> words, Pattern pattern)
    {
        switch (pattern)
        {
            case Pattern::Lowercase:
                for (auto& word : words)
                    toLowerCaseInplace(word);
                break;
            case Pattern::Uppercase:
                for (auto& word : words)
                    toUpperCaseInplace(word);
                break;
            case Pattern::Capital:
                for (auto& word : words)
                    capitalize(word);
                break;
            case Pattern::Camel:
                for (std::size_t i = 0; i < words.size(); ++i)
                {
                    if (i == 0)
                        toLowerCaseInplace(words[i]);
                    else
                        capitalize(words[i]);
                }
                break;
            case Pattern::Toggle:
                for (auto& word : words)
                    toggle(word);
                break;
            case Pattern::Alternating:
                alternate(words);
                break;
        }
        return words;
    }
}
