#include <naming/segmented_string.hpp>

#include <log/log.hpp>
#include <utility/algorithm/case_convert.hpp>
#include <utility/utf8.hpp>

#include <cstddef>
#include <utility>

using namespace Utility::Algorithm;

namespace Naming
{
    namespace
    {
        enum class CharacterClass
        {
            Upper,
            Lower,
            // Letters without case, e.g. CJK ideographs.
            Letter,
            Digit,
            Other
        };

        CharacterClass classify(Utility::Utf8::CodePointAndLength const& decoded)
        {
            if (!decoded.valid)
                return CharacterClass::Other;
            if (isUpperCase(decoded.codePoint))
                return CharacterClass::Upper;
            if (isLowerCase(decoded.codePoint))
                return CharacterClass::Lower;
            if (isNumeric(decoded.codePoint))
                return CharacterClass::Digit;
            if (isAlphabetic(decoded.codePoint))
                return CharacterClass::Letter;
            return CharacterClass::Other;
        }

        bool isLetter(CharacterClass cls)
        {
            return cls == CharacterClass::Upper || cls == CharacterClass::Lower || cls == CharacterClass::Letter;
        }

        bool splitsBetween(BoundarySet const& boundaries, CharacterClass previous, CharacterClass current)
        {
            if (boundaries.contains(Boundary::LowerUpper) && previous == CharacterClass::Lower &&
                current == CharacterClass::Upper)
                return true;

            if (boundaries.contains(Boundary::AlphaNumeric))
            {
                if (isLetter(previous) && current == CharacterClass::Digit)
                    return true;
                if (previous == CharacterClass::Digit && isLetter(current))
                    return true;
            }
            return false;
        }

        std::string joinWords(std::vector<std::string> const& words, std::string_view delimiter)
        {
            std::string result{};
            for (std::size_t i = 0; i < words.size(); ++i)
            {
                if (i != 0)
                    result += delimiter;
                result += words[i];
            }
            return result;
        }
    }

    SegmentedString SegmentedString::segment(std::string_view text, BoundarySet boundaries)
    {
        SegmentedString result{};
        std::string current{};
        // Byte offset of the previous code point within current.
        std::size_t previousStart = 0;

        const auto endWord = [&result, &current]() {
            if (!current.empty())
                result.segments.push_back(std::exchange(current, std::string{}));
        };

        // Delimiters and the start of the text never take part in a rule.
        auto beforePrevious = CharacterClass::Other;
        auto previous = CharacterClass::Other;

        Utility::Utf8::forEachCodePoint(text, [&](Utility::Utf8::CodePointAndLength const& decoded, std::string_view bytes) {
            if (decoded.valid && boundaries.consumes(decoded.codePoint))
            {
                endWord();
                beforePrevious = CharacterClass::Other;
                previous = CharacterClass::Other;
                return;
            }

            const auto kind = classify(decoded);
            if (boundaries.contains(Boundary::Acronym) && beforePrevious == CharacterClass::Upper &&
                previous == CharacterClass::Upper && kind == CharacterClass::Lower)
            {
                // The last uppercase letter of the run starts the next word.
                std::string last = current.substr(previousStart);
                current.resize(previousStart);
                endWord();
                current = std::move(last);
            }
            else if (splitsBetween(boundaries, previous, kind))
            {
                endWord();
            }

            previousStart = current.size();
            current.append(bytes);
            beforePrevious = previous;
            previous = kind;
        });
        endWord();

        Log::trace("Split '{}' into {} word(s)", text, result.segments.size());
        return result;
    }

    std::string SegmentedString::render(Convention convention) const
    {
        auto const& traits = conventionTraits(convention);
        return render(traits.pattern, traits.delimiter);
    }

    std::string SegmentedString::render(Pattern pattern, std::string_view delimiter) const
    {
        return joinWords(applyPattern(segments, pattern), delimiter);
    }

    std::string SegmentedString::joined(std::string_view delimiter) const
    {
        return joinWords(segments, delimiter);
    }

    std::vector<std::string> segment(std::string_view text, BoundarySet boundaries)
    {
        return SegmentedString::segment(text, boundaries).segments;
    }

    std::string render(std::vector<std::string> words, Convention convention)
    {
        return SegmentedString{std::move(words)}.render(convention);
    }
}
