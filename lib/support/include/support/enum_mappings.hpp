#ifndef netpath_lib_support_include_support_enum_mappings_hpp
#define netpath_lib_support_include_support_enum_mappings_hpp

#include <string_view>
#include <type_traits>
#include <utility>

#include <range/v3/algorithm/find.hpp>

#include "support/ranges/functional.hpp"

template <typename T>
using EnumerationMappingType = std::pair<std::string_view, T>;

template <typename T> [[nodiscard]] constexpr auto enumeration() = delete;

template <typename T>
  requires std::is_enum_v<T>
[[nodiscard]] constexpr std::string_view toStringView(const T Val) {
  constexpr auto Mappings = enumeration<T>();
  const auto Iter = ranges::find(Mappings, Val, Value);
  if (Iter == Mappings.end()) {
    return "unknown";
  }
  return Index(*Iter);
}

#endif
