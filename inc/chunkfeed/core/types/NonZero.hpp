#pragma once

#include <type_traits>

#include "chunkfeed/core/errors/Asserts.hpp"

namespace cfd
{
template <typename T>
struct NonZero {
    static_assert(std::is_integral_v<T>, "T must be an integral type");

    constexpr NonZero(const T value)
        : v(value)
    {
        CFD_ASSERT((v != 0), "Initializing NonZero instance with zero value");
    }

    operator T() const
    {
        return v;
    }

    const T v;
};

}  // namespace cfd
