#pragma once

#include <naming/boundary.hpp>
#include <naming/convention.hpp>
#include <naming/pattern.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace Naming
{
    /**
     * @brief Text split into its words.
     *
     * Words keep their characters verbatim. Only rendering re-cases them.
     * There are never empty words, so segments is empty exactly when the text held nothing but delimiters.
     */
    struct SegmentedString
    {
        std::vector<std::string> segments;

        /**
         * @brief Splits text in a single left to right pass.
         *
         * @param text UTF-8 text to split. Letters and digits are classified by their Unicode properties. Ill-formed bytes
         * count as punctuation and are kept as they are.
         * @param boundaries The boundaries that end a word.
         */
        static SegmentedString segment(std::string_view text, BoundarySet boundaries = BoundarySet::all());

        std::string render(Convention convention) const;
        std::string render(Pattern pattern, std::string_view delimiter) const;

        std::string joined(std::string_view delimiter) const;
    };

    std::vector<std::string> segment(std::string_view text, BoundarySet boundaries = BoundarySet::all());
    std::string render(std::vector<std::string> words, Convention convention);
}
