#pragma once

#include <naming/boundary.hpp>
#include <naming/convention.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace Naming
{
    class FromCase;

    /**
     * @brief Converts text to the given convention, splitting on every boundary.
     *
     * @param text The text to convert.
     * @param to The target convention.
     * @return std::string The converted text. Never fails, text without any boundary is a single word.
     */
    std::string toCase(std::string_view text, Convention to);

    /**
     * @brief Remembers which convention text is in, so that only that convention's boundaries split it.
     * Nothing is split until toCase is called on the result.
     */
    FromCase fromCase(std::string_view text, Convention from);

    class FromCase
    {
      public:
        FromCase(std::string text, Convention source);

        std::string toCase(Convention to) const;

        /**
         * @brief Returns a copy that assumes another source convention.
         * A custom boundary set, if any, is dropped.
         */
        FromCase fromCase(Convention source) const;

        /**
         * @brief Returns a copy that splits by the given boundaries instead of those of the source convention.
         */
        FromCase withBoundaries(BoundarySet boundaries) const;

        std::string const& text() const
        {
            return text_;
        }

        Convention source() const
        {
            return source_;
        }

        BoundarySet boundaries() const;

        friend bool operator==(FromCase const&, FromCase const&) = default;

      private:
        std::string text_;
        Convention source_;
        std::optional<BoundarySet> boundaries_;
    };

    /**
     * @brief Gives any string-like value the toCase and fromCase operations.
     * Does not own the text, so it must not outlive it.
     */
    class Casing
    {
      public:
        explicit Casing(std::string_view text)
            : text_{text}
        {}

        std::string toCase(Convention to) const
        {
            return Naming::toCase(text_, to);
        }

        FromCase fromCase(Convention from) const
        {
            return Naming::fromCase(text_, from);
        }

      private:
        std::string_view text_;
    };
}
