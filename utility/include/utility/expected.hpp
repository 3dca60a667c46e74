#pragma once

#include <version>

#ifdef __cpp_lib_expected
#    include <expected>
#else
#    include <tl/expected.hpp>
#endif

#include <type_traits>
#include <utility>

namespace Utility
{
#ifdef __cpp_lib_expected
    template <typename T, typename E>
    using Expected = std::expected<T, E>;

    template <typename E>
    using Unexpected = std::unexpected<E>;
#else
    template <typename T, typename E>
    using Expected = tl::expected<T, E>;

    template <typename E>
    using Unexpected = tl::unexpected<E>;
#endif

    template <typename E>
    Unexpected<std::decay_t<E>> makeUnexpected(E&& error)
    {
        return Unexpected<std::decay_t<E>>{std::forward<E>(error)};
    }
}
