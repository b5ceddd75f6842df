#ifndef netpath_lib_netpath_include_netpath_connection_hpp
#define netpath_lib_netpath_include_netpath_connection_hpp

#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>

#include "netpath/point.hpp"

// Directed edge to Target. Equality only looks at the identity of the target.
template <Point PointType> class Connection {
public:
  explicit Connection(PointType Target) : Target_{std::move(Target)} {}

  [[nodiscard]] const PointType &getTarget() const { return Target_; }

  [[nodiscard]] bool targets(const PointType &Val) const {
    return isSamePoint(Target_, Val);
  }

  [[nodiscard]] friend bool operator==(const Connection &Lhs,
                                       const Connection &Rhs) {
    return Lhs.targets(Rhs.Target_);
  }

private:
  PointType Target_;
};

template <Point PointType> class fmt::formatter<Connection<PointType>> {
public:
  // NOLINTBEGIN(readability-convert-member-functions-to-static)
  [[nodiscard]] constexpr format_parse_context::iterator
  parse(format_parse_context &Ctx) {
    return Ctx.begin();
  }

  [[nodiscard]] format_context::iterator
  format(const Connection<PointType> &Val, format_context &Ctx) const {
    return fmt::format_to(Ctx.out(), "{}", Val.getTarget().getIdentifier());
  }
  // NOLINTEND(readability-convert-member-functions-to-static)
};

#endif
