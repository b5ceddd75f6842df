#ifndef netpath_lib_netpath_include_netpath_point_hpp
#define netpath_lib_netpath_include_netpath_point_hpp

#include <concepts>
#include <type_traits>
#include <utility>

#include <fmt/core.h>

template <typename T>
using IdentifierType =
    std::remove_cvref_t<decltype(std::declval<const T &>().getIdentifier())>;

// A point is a small copyable handle whose identity is its identifier. The
// identifier has to be formattable so paths can be rendered.
template <typename T>
concept Point = std::copyable<T> && requires(const T &Val) {
  { Val.getIdentifier() } -> std::equality_comparable;
} && fmt::is_formattable<IdentifierType<T>>::value;

template <Point PointType>
[[nodiscard]] bool isSamePoint(const PointType &Lhs, const PointType &Rhs) {
  return Lhs.getIdentifier() == Rhs.getIdentifier();
}

inline constexpr auto ToIdentifier =
    []<Point PointType>(const PointType &Val) -> IdentifierType<PointType> {
  return Val.getIdentifier();
};

inline constexpr auto IsSamePointAs = []<Point PointType>(PointType Rhs) {
  return [Rhs = std::move(Rhs)](const PointType &Lhs) {
    return isSamePoint(Lhs, Rhs);
  };
};

#endif
