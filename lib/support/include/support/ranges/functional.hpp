#ifndef netpath_lib_support_include_support_ranges_functional_hpp
#define netpath_lib_support_include_support_ranges_functional_hpp

#include <concepts>
#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>

template <std::size_t I>
inline constexpr auto Element = []<typename T>
  requires(std::tuple_size_v<std::remove_cvref_t<T>> > I)
(T &&Tuple) -> decltype(auto) { return std::get<I>(std::forward<T>(Tuple)); };

constexpr auto Index = Element<0>;
constexpr auto Value = Element<1>;

template <typename T>
inline constexpr auto Construct = []<typename... ValueType>(ValueType &&...Val)
  requires std::constructible_from<T, ValueType...>
{ return T{std::forward<ValueType>(Val)...}; };

#endif
