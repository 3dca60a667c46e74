#pragma once

#include <utility/describe.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <initializer_list>
#include <vector>

namespace Naming
{
    /**
     * @brief A rule that decides whether a word ends between two adjacent characters.
     *
     * Space, Underscore and Hyphen consume their character. It never appears in a word.
     * Acronym places the boundary before the last uppercase letter of a run that is followed by a lowercase letter,
     * so "XMLHttp" splits into "XML" and "Http".
     */
    BOOST_DEFINE_ENUM_CLASS(Boundary, Space, Underscore, Hyphen, LowerUpper, Acronym, AlphaNumeric)

    class BoundarySet
    {
      public:
        constexpr BoundarySet() = default;
        constexpr BoundarySet(std::initializer_list<Boundary> boundaries)
        {
            for (auto boundary : boundaries)
                bits_ |= bit(boundary);
        }

        /**
         * @brief Every boundary. This is what text is split by when its convention is not known.
         */
        static constexpr BoundarySet all()
        {
            return {
                Boundary::Space,
                Boundary::Underscore,
                Boundary::Hyphen,
                Boundary::LowerUpper,
                Boundary::Acronym,
                Boundary::AlphaNumeric,
            };
        }

        static constexpr BoundarySet none()
        {
            return {};
        }

        constexpr bool contains(Boundary boundary) const
        {
            return (bits_ & bit(boundary)) != 0;
        }

        constexpr BoundarySet with(Boundary boundary) const
        {
            BoundarySet result = *this;
            result.bits_ |= bit(boundary);
            return result;
        }

        constexpr BoundarySet without(Boundary boundary) const
        {
            BoundarySet result = *this;
            result.bits_ &= static_cast<std::uint8_t>(~bit(boundary));
            return result;
        }

        constexpr bool empty() const
        {
            return bits_ == 0;
        }

        /**
         * @brief Whether c is an explicit delimiter under this set and is dropped from the output.
         */
        bool consumes(char32_t c) const;

        /**
         * @brief The contained boundaries in declaration order.
         */
        std::vector<Boundary> boundaries() const;

        friend constexpr bool operator==(BoundarySet const&, BoundarySet const&) = default;

      private:
        static constexpr std::uint8_t bit(Boundary boundary)
        {
            return static_cast<std::uint8_t>(1u << static_cast<unsigned>(boundary));
        }

      private:
        std::uint8_t bits_{0};
    };

    void to_json(nlohmann::json& j, Boundary const& boundary);
    void from_json(nlohmann::json const& j, Boundary& boundary);

    void to_json(nlohmann::json& j, BoundarySet const& boundaries);
    void from_json(nlohmann::json const& j, BoundarySet& boundaries);
}
