#include <naming/casing.hpp>
#include <naming/segmented_string.hpp>

#include <log/log.hpp>

#include <utility>

namespace Naming
{
    std::string toCase(std::string_view text, Convention to)
    {
        return SegmentedString::segment(text, BoundarySet::all()).render(to);
    }

    FromCase fromCase(std::string_view text, Convention from)
    {
        return FromCase{std::string{text}, from};
    }

    FromCase::FromCase(std::string text, Convention source)
        : text_{std::move(text)}
        , source_{source}
        , boundaries_{std::nullopt}
    {}

    std::string FromCase::toCase(Convention to) const
    {
        Log::debug(
            "Converting '{}' from {} to {}{}",
            text_,
            conventionName(source_),
            conventionName(to),
            boundaries_ ? " with custom boundaries" : "");
        return SegmentedString::segment(text_, boundaries()).render(to);
    }

    FromCase FromCase::fromCase(Convention source) const
    {
        return FromCase{text_, source};
    }

    FromCase FromCase::withBoundaries(BoundarySet boundaries) const
    {
        FromCase result{*this};
        result.boundaries_ = boundaries;
        return result;
    }

    BoundarySet FromCase::boundaries() const
    {
        return boundaries_.value_or(conventionTraits(source_).boundaries);
    }
}
