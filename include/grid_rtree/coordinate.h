#pragma once

#include <type_traits>

namespace grid_rtree {

// Axis value types: ordered, copyable integers with 0/1 and +,-,*.
template <typename T>
struct is_coordinate
    : std::integral_constant<bool, std::is_integral_v<T> && !std::is_same_v<std::remove_cv_t<T>, bool>> {};

template <typename T>
inline constexpr bool is_coordinate_v = is_coordinate<T>::value;

} // namespace grid_rtree
