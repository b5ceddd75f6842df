#ifndef netpath_lib_netpath_include_netpath_path_hpp
#define netpath_lib_netpath_include_netpath_path_hpp

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/equal.hpp>
#include <range/v3/algorithm/for_each.hpp>
#include <range/v3/range/concepts.hpp>
#include <range/v3/range/traits.hpp>
#include <range/v3/view/transform.hpp>

#include "netpath/point.hpp"
#include "support/netpath_exception.hpp"

inline constexpr std::string_view DefaultPathSeparator = "-";

template <Point PointType> class PathBuilder;

// Ordered route of points. Search branches never share a Path: extendedBy
// returns a copy, so a branch can grow its route without touching its
// siblings.
template <Point PointType> class Path {
public:
  using value_type = PointType;

  void push(PointType Val) { Points_.push_back(std::move(Val)); }

  [[nodiscard]] Path extendedBy(PointType Val) const {
    auto Extended = *this;
    Extended.push(std::move(Val));
    return Extended;
  }

  [[nodiscard]] bool contains(const PointType &Val) const {
    return ranges::any_of(Points_, IsSamePointAs(Val));
  }

  [[nodiscard]] bool doesNotContain(const PointType &Val) const {
    return !contains(Val);
  }

  [[nodiscard]] bool startsWith(const PointType &Val) const {
    return !Points_.empty() && isSamePoint(Points_.front(), Val);
  }

  [[nodiscard]] bool endsWith(const PointType &Val) const {
    return !Points_.empty() && isSamePoint(Points_.back(), Val);
  }

  [[nodiscard]] std::string
  render(const std::string_view Separator = DefaultPathSeparator) const {
    return fmt::format(
        "{}",
        fmt::join(Points_ | ranges::views::transform(ToIdentifier), Separator));
  }

  [[nodiscard]] const std::vector<PointType> &getPoints() const {
    return Points_;
  }

  [[nodiscard]] std::size_t size() const { return Points_.size(); }

  [[nodiscard]] const PointType &front() const { return Points_.front(); }
  [[nodiscard]] const PointType &back() const { return Points_.back(); }

  [[nodiscard]] friend bool operator==(const Path &Lhs, const Path &Rhs) {
    return ranges::equal(Lhs.Points_, Rhs.Points_,
                         [](const PointType &LhsPoint,
                            const PointType &RhsPoint) {
                           return isSamePoint(LhsPoint, RhsPoint);
                         });
  }

private:
  friend class PathBuilder<PointType>;

  explicit Path(std::vector<PointType> Points) : Points_{std::move(Points)} {}

  std::vector<PointType> Points_;
};

template <Point PointType> class PathBuilder {
public:
  PathBuilder &addPoint(PointType Val) {
    Points_.push_back(std::move(Val));
    return *this;
  }

  template <ranges::input_range RangeType>
    requires std::convertible_to<ranges::range_reference_t<RangeType>,
                                 PointType>
  PathBuilder &addPoints(RangeType &&Range) {
    ranges::for_each(std::forward<RangeType>(Range),
                     [this](const PointType &Val) { addPoint(Val); });
    return *this;
  }

  PathBuilder &addPoints(std::initializer_list<PointType> Points) {
    ranges::for_each(Points, [this](const PointType &Val) { addPoint(Val); });
    return *this;
  }

  [[nodiscard]] Path<PointType> build() const {
    NetPathException::check(!Points_.empty(), ErrorKind::EmptyPath,
                            "cannot build a path without any point");
    return Path<PointType>{Points_};
  }

private:
  std::vector<PointType> Points_{};
};

template <Point PointType> class fmt::formatter<Path<PointType>> {
public:
  // NOLINTBEGIN(readability-convert-member-functions-to-static)
  [[nodiscard]] constexpr format_parse_context::iterator
  parse(format_parse_context &Ctx) {
    return Ctx.begin();
  }

  [[nodiscard]] format_context::iterator format(const Path<PointType> &Val,
                                                format_context &Ctx) const {
    return fmt::format_to(Ctx.out(), "{}", Val.render());
  }
  // NOLINTEND(readability-convert-member-functions-to-static)
};

#endif
