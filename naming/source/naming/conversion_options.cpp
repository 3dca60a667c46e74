#include <naming/conversion_options.hpp>
#include <naming/casing.hpp>

#include <log/log.hpp>

namespace Naming
{
    std::string ConversionOptions::apply(std::string_view text) const
    {
        if (boundaries)
            return fromCase(text, from.value_or(to)).withBoundaries(*boundaries).toCase(to);
        if (from)
            return fromCase(text, *from).toCase(to);
        return toCase(text, to);
    }

    void ConversionOptions::useDefaultsFrom(ConversionOptions const& other)
    {
        if (!from)
            from = other.from;
        if (!boundaries)
            boundaries = other.boundaries;
    }

    void to_json(nlohmann::json& j, ConversionOptions const& options)
    {
        j = nlohmann::json::object();
        if (options.from)
            j["from"] = *options.from;
        j["to"] = options.to;
        if (options.boundaries)
            j["boundaries"] = *options.boundaries;
    }
    void from_json(nlohmann::json const& j, ConversionOptions& options)
    {
        if (j.contains("from"))
            options.from = j["from"].get<Convention>();

        if (j.contains("to"))
            options.to = j["to"].get<Convention>();

        if (j.contains("boundaries"))
            options.boundaries = j["boundaries"].get<BoundarySet>();

        Log::debug(
            "Loaded conversion options: from {} to {}{}",
            options.from ? conventionName(*options.from) : std::string{"any"},
            conventionName(options.to),
            options.boundaries ? " with custom boundaries" : "");
    }
}
