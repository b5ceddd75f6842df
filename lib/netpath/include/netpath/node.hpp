#ifndef netpath_lib_netpath_include_netpath_node_hpp
#define netpath_lib_netpath_include_netpath_node_hpp

#include <concepts>
#include <initializer_list>
#include <optional>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/equal.hpp>
#include <range/v3/algorithm/for_each.hpp>
#include <range/v3/algorithm/none_of.hpp>
#include <range/v3/range/concepts.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/range/traits.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>
#include <spdlog/spdlog.h>

#include "netpath/connection.hpp"
#include "netpath/path.hpp"
#include "netpath/point.hpp"
#include "support/netpath_exception.hpp"

template <Point PointType> class NodeBuilder;

// Adjacency list entry of a net. Only NodeBuilder creates nodes, which
// guarantees that a node is never connected to its own point and never holds
// two connections to the same target.
template <Point PointType> class Node {
public:
  using ConnectionType = Connection<PointType>;

  [[nodiscard]] const PointType &getPoint() const { return Point_; }

  [[nodiscard]] const std::vector<ConnectionType> &getConnections() const {
    return Connections_;
  }

  [[nodiscard]] bool pointIs(const PointType &Val) const {
    return isSamePoint(Point_, Val);
  }

  [[nodiscard]] bool isConnectedTo(const PointType &Val) const {
    return ranges::any_of(Connections_, [&Val](const ConnectionType &Conn) {
      return Conn.targets(Val);
    });
  }

  // The next hops a search may take from this node: every target that is not
  // already part of the route, in connection order.
  [[nodiscard]] std::optional<std::vector<PointType>>
  getConnectedPointsNotIn(const Path<PointType> &Route) const {
    auto Candidates =
        Connections_ | ranges::views::transform(&ConnectionType::getTarget) |
        ranges::views::filter([&Route](const PointType &Target) {
          return Route.doesNotContain(Target);
        }) |
        ranges::to<std::vector<PointType>>;
    if (Candidates.empty()) {
      return std::nullopt;
    }
    return Candidates;
  }

  [[nodiscard]] friend bool operator==(const Node &Lhs, const Node &Rhs) {
    return isSamePoint(Lhs.Point_, Rhs.Point_) &&
           ranges::equal(Lhs.Connections_, Rhs.Connections_);
  }

private:
  friend class NodeBuilder<PointType>;

  Node(PointType Point, std::vector<ConnectionType> Connections)
      : Point_{std::move(Point)},
        Connections_{std::move(Connections)} {}

  PointType Point_;
  std::vector<ConnectionType> Connections_;
};

template <Point PointType> class NodeBuilder {
public:
  using ConnectionType = Connection<PointType>;

  NodeBuilder &setPoint(PointType Val) {
    Point_ = std::move(Val);
    return *this;
  }

  NodeBuilder &addConnection(PointType Val) {
    if (ranges::any_of(Connections_, [&Val](const ConnectionType &Conn) {
          return Conn.targets(Val);
        })) {
      spdlog::trace("NodeBuilder: ignoring duplicate connection to {}",
                    Val.getIdentifier());
      return *this;
    }
    Connections_.emplace_back(std::move(Val));
    return *this;
  }

  template <ranges::input_range RangeType>
    requires std::convertible_to<ranges::range_reference_t<RangeType>,
                                 PointType>
  NodeBuilder &addConnections(RangeType &&Range) {
    ranges::for_each(std::forward<RangeType>(Range),
                     [this](const PointType &Val) { addConnection(Val); });
    return *this;
  }

  NodeBuilder &addConnections(std::initializer_list<PointType> Points) {
    ranges::for_each(Points,
                     [this](const PointType &Val) { addConnection(Val); });
    return *this;
  }

  [[nodiscard]] Node<PointType> build() const {
    NetPathException::check(Point_.has_value(), ErrorKind::MissingPoint,
                            "cannot build a node without a point");
    NetPathException::check(
        ranges::none_of(Connections_,
                        [this](const ConnectionType &Conn) {
                          return Conn.targets(*Point_);
                        }),
        ErrorKind::SelfConnection, "point {} is connected to itself",
        Point_->getIdentifier());
    return Node<PointType>{*Point_, Connections_};
  }

private:
  std::optional<PointType> Point_{};
  std::vector<ConnectionType> Connections_{};
};

template <Point PointType> class fmt::formatter<Node<PointType>> {
public:
  // NOLINTBEGIN(readability-convert-member-functions-to-static)
  [[nodiscard]] constexpr format_parse_context::iterator
  parse(format_parse_context &Ctx) {
    return Ctx.begin();
  }

  [[nodiscard]] format_context::iterator format(const Node<PointType> &Val,
                                                format_context &Ctx) const {
    return fmt::format_to(Ctx.out(), "{} -> [{}]",
                          Val.getPoint().getIdentifier(),
                          fmt::join(Val.getConnections(), ", "));
  }
  // NOLINTEND(readability-convert-member-functions-to-static)
};

#endif
