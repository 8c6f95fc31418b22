#pragma once

#include <functional>
#include <optional>
#include <type_traits>

namespace cfd
{

template <typename Derived, typename Base>
static inline std::optional<std::reference_wrapper<std::remove_reference_t<Derived>>> dyn_cast(Base& base)
{
    auto* derived = dynamic_cast<std::remove_reference_t<Derived>*>(&base);
    if (derived == nullptr) {
        return std::nullopt;
    }
    return *derived;
}

}  // namespace cfd
