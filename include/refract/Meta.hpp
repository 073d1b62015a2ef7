#pragma once

#include <type_traits>
#include <utility>

namespace refract {

namespace details {

template <typename T, typename = void>
struct has_equality_impl : std::false_type {};

template <typename T>
struct has_equality_impl<T, std::void_t<decltype(std::declval<T const&>() == std::declval<T const&>())>>
    : std::true_type {};

} // namespace details

template <typename T> constexpr bool has_equality = details::has_equality_impl<T>::value;

} // namespace refract
