#pragma once

#include <naming/boundary.hpp>
#include <naming/convention.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace Naming
{
    /**
     * @brief A stored conversion setting, e.g. the naming rule a code generator applies to generated identifiers.
     *
     * Splitting uses boundaries if set, otherwise the boundaries of from if set, otherwise every boundary.
     */
    struct ConversionOptions
    {
        std::optional<Convention> from{std::nullopt};
        Convention to{Convention::Snake};
        std::optional<BoundarySet> boundaries{std::nullopt};

        std::string apply(std::string_view text) const;

        void useDefaultsFrom(ConversionOptions const& other);
    };
    void to_json(nlohmann::json& j, ConversionOptions const& options);
    void from_json(nlohmann::json const& j, ConversionOptions& options);
}
