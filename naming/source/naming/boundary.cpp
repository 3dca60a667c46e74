#include <naming/boundary.hpp>

#include <utility/algorithm/case_convert.hpp>
#include <utility/enum_string_convert.hpp>

namespace Naming
{
    bool BoundarySet::consumes(char32_t c) const
    {
        if (c == U'_')
            return contains(Boundary::Underscore);
        if (c == U'-')
            return contains(Boundary::Hyphen);
        return contains(Boundary::Space) && Utility::Algorithm::isAsciiWhitespace(c);
    }

    std::vector<Boundary> BoundarySet::boundaries() const
    {
        std::vector<Boundary> result{};
        for (auto boundary : Utility::enumValues<Boundary>())
        {
            if (contains(boundary))
                result.push_back(boundary);
        }
        return result;
    }

    void to_json(nlohmann::json& j, Boundary const& boundary)
    {
        j = Utility::enumToString<Boundary>(boundary);
    }
    void from_json(nlohmann::json const& j, Boundary& boundary)
    {
        boundary = Utility::enumFromString<Boundary>(j.get<std::string>());
    }

    void to_json(nlohmann::json& j, BoundarySet const& boundaries)
    {
        j = nlohmann::json::array();
        for (auto boundary : boundaries.boundaries())
            j.push_back(boundary);
    }
    void from_json(nlohmann::json const& j, BoundarySet& boundaries)
    {
        boundaries = BoundarySet::none();
        for (auto const& element : j)
            boundaries = boundaries.with(element.get<Boundary>());
    }
}
