#pragma once

#include <utility/describe.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <stdexcept>

namespace Utility
{
    template <typename EnumType>
    inline constexpr std::size_t enumCount =
        boost::mp11::mp_size<boost::describe::describe_enumerators<EnumType>>::value;

    /**
     * @brief Returns all described enumerators in declaration order.
     */
    template <typename EnumType>
    constexpr std::array<EnumType, enumCount<EnumType>> enumValues()
    {
        std::array<EnumType, enumCount<EnumType>> values{};
        std::size_t index = 0;
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<EnumType>>([&values, &index](auto desc) {
            values[index++] = desc.value;
        });
        return values;
    }

    template <typename EnumType>
    std::string enumToString(EnumType const& enumValue)
    {
        char const* result = nullptr;
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<EnumType>>([&result, &enumValue](auto desc) {
            if (enumValue == desc.value)
                result = desc.name;
        });

        if (result == nullptr)
            throw std::invalid_argument("Invalid enum value");
        return result;
    }

    template <typename EnumType>
    EnumType enumFromString(std::string_view str)
    {
        EnumType enumValue{};
        bool found = false;
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<EnumType>>(
            [&found, &enumValue, &str](auto desc) {
                if (str == desc.name)
                {
                    enumValue = desc.value;
                    found = true;
                }
            });

        if (!found)
            throw std::invalid_argument("Invalid enum string: " + std::string{str});

        return enumValue;
    }
}
