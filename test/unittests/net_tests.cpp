#include <cstddef>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <fmt/core.h>
#include <fmt/format.h>

#include "netpath/config.hpp"
#include "netpath/named_point.hpp"
#include "netpath/net.hpp"
#include "netpath_tests.hpp"
#include "support/netpath_exception.hpp"

namespace {
struct Coordinates {
  int X;
  int Y;

  [[nodiscard]] friend bool operator==(const Coordinates &,
                                       const Coordinates &) = default;
};

struct Tile {
  Coordinates Position;

  [[nodiscard]] Coordinates getIdentifier() const { return Position; }
};

// Counts how often any instance is copied.
class CopyCountedPoint {
public:
  explicit CopyCountedPoint(const int Id) : Id_{Id} {}

  CopyCountedPoint(const CopyCountedPoint &Other) : Id_{Other.Id_} {
    ++Copies;
  }
  CopyCountedPoint &operator=(const CopyCountedPoint &Other) {
    Id_ = Other.Id_;
    ++Copies;
    return *this;
  }
  CopyCountedPoint(CopyCountedPoint &&) noexcept = default;
  CopyCountedPoint &operator=(CopyCountedPoint &&) noexcept = default;
  ~CopyCountedPoint() = default;

  [[nodiscard]] int getIdentifier() const { return Id_; }

  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  inline static std::size_t Copies = 0U;

private:
  int Id_;
};

// A - B
[[nodiscard]] Net<SimplePoint> makeABNet() {
  return makeNet({makeNode(A, {B}), makeNode(B, {A})});
}

// A - B - C
//  \  |  /
//     D
[[nodiscard]] Net<SimplePoint> makeMeshedNet() {
  return makeNet({makeNode(A, {B, D}), makeNode(B, {A, C, D}),
                  makeNode(C, {B, D}), makeNode(D, {A, B, C})});
}
} // namespace

template <> class fmt::formatter<Coordinates> {
public:
  [[nodiscard]] constexpr format_parse_context::iterator
  parse(format_parse_context &Ctx) {
    return Ctx.begin();
  }

  [[nodiscard]] format_context::iterator format(const Coordinates &Val,
                                                format_context &Ctx) const {
    return fmt::format_to(Ctx.out(), "({}, {})", Val.X, Val.Y);
  }
};

TEST_CASE("points missing from the net") {
  const auto Network = makeABNet();

  testFailure(Network, C, A, ErrorKind::PointNotFound);
  testFailure(Network, A, C, ErrorKind::PointNotFound);

  SECTION("the start point is checked first") {
    try {
      std::ignore = Network.findPaths(C, D);
      FAIL("findPaths should throw");
    } catch (const NetPathException &Ex) {
      REQUIRE(Ex.getKind() == ErrorKind::PointNotFound);
      REQUIRE(std::string{Ex.what()} ==
              R"(The point with id "C" could not be found)");
    }
  }
}

TEST_CASE("two connected points") {
  test(makeABNet(), A, B, {"A-B"});
  test(makeABNet(), B, A, {"B-A"});
}

TEST_CASE("two isolated points") {
  testFailure(makeNet({makeNode(A, {}), makeNode(B, {})}), A, B,
              ErrorKind::NoPathFound);
}

TEST_CASE("linear net") {
  const auto Network =
      makeNet({makeNode(A, {B}), makeNode(B, {A, C}), makeNode(C, {B})});
  test(Network, A, C, {"A-B-C"});
  test(Network, C, A, {"C-B-A"});
  test(Network, B, C, {"B-C"});
}

TEST_CASE("square net") {
  // A - B
  // |   |
  // D - C
  const auto Network =
      makeNet({makeNode(A, {B, D}), makeNode(B, {A, C}), makeNode(C, {B, D}),
               makeNode(D, {A, C})});
  test(Network, A, C, {"A-B-C", "A-D-C"});
  test(Network, B, D, {"B-A-D", "B-C-D"});
}

TEST_CASE("meshed net") {
  const auto Network = makeMeshedNet();
  test(Network, A, C, {"A-B-C", "A-B-D-C", "A-D-B-C", "A-D-C"});

  SECTION("results follow the connection order") {
    REQUIRE(toRenderedPaths(Network.findPaths(A, C)) ==
            std::vector<std::string>{"A-B-C", "A-B-D-C", "A-D-B-C", "A-D-C"});
  }

  SECTION("repeated searches return the same paths") {
    REQUIRE(Network.findPaths(A, C) == Network.findPaths(A, C));
  }
}

TEST_CASE("dead ends do not stop sibling branches") {
  const auto Network =
      makeNet({makeNode(A, {E, B, D}), makeNode(B, {A, C}), makeNode(C, {B}),
               makeNode(D, {A}), makeNode(E, {A})});
  test(Network, A, C, {"A-B-C"});
}

TEST_CASE("connections are directed") {
  const auto Network = makeNet({makeNode(A, {B}), makeNode(B, {})});
  test(Network, A, B, {"A-B"});
  testFailure(Network, B, A, ErrorKind::NoPathFound);
}

TEST_CASE("searching from a point to itself") {
  test(makeABNet(), A, A, {"A"});
}

TEST_CASE("connection to a point without node") {
  const auto Network = makeNet({makeNode(A, {C, B}), makeNode(B, {A})});
  testFailure(Network, A, B, ErrorKind::InconsistentNet);
}

TEST_CASE("nets reject duplicate points") {
  const auto Kind = captureErrorKind([]() {
    std::ignore =
        makeNet({makeNode(A, {B}), makeNode(B, {A}), makeNode(A, {C})});
  });
  REQUIRE(Kind == ErrorKind::DuplicatePoint);

  SECTION("identifiers that are only equality comparable") {
    const auto Origin = Tile{{0, 0}};
    const auto Right = Tile{{1, 0}};
    const auto TileKind = captureErrorKind([&Origin, &Right]() {
      std::ignore = Net<Tile>{{makeNode(Origin, {Right}),
                               makeNode(Right, {Origin}),
                               makeNode(Tile{{1, 0}}, {})}};
    });
    REQUIRE(TileKind == ErrorKind::DuplicatePoint);

    const auto Network = Net<Tile>{
        {makeNode(Origin, {Right}), makeNode(Right, {Origin})}};
    test(Network, Origin, Right, {"(0, 0)-(1, 0)"});
  }
}

TEST_CASE("node lookup") {
  const auto Network = makeABNet();
  REQUIRE(Network.size() == 2U);
  REQUIRE(Network.contains(A));
  REQUIRE_FALSE(Network.contains(C));
  REQUIRE(Network.findNode(C) == nullptr);

  const auto *const NodeOfB = Network.findNode(SimplePoint{'B'});
  REQUIRE(NodeOfB != nullptr);
  REQUIRE(NodeOfB->pointIs(B));
  REQUIRE(NodeOfB->isConnectedTo(A));
}

TEST_CASE("net formatting") {
  const auto Network = makeABNet();
  REQUIRE(fmt::format("{:s}", Network) == "|V| = 2, |E| = 2");
  REQUIRE(fmt::format("{}", Network) == "A -> [B]\nB -> [A]");

  const auto Dot = fmt::format("{:d}", Network);
  REQUIRE(Dot.starts_with("digraph D {"));
  REQUIRE(Dot.find(R"("A" -> "B")") != std::string::npos);
  REQUIRE(Dot.find(R"("B" -> "A")") != std::string::npos);
}

TEST_CASE("connection count") {
  REQUIRE(makeABNet().countConnections() == 2U);
  REQUIRE(makeMeshedNet().countConnections() == 10U);
  REQUIRE(makeNet({makeNode(A, {}), makeNode(B, {})}).countConnections() ==
          0U);
}

TEST_CASE("nets need a config") {
  const auto Kind = captureErrorKind([]() {
    std::ignore = makeNet({makeNode(A, {B}), makeNode(B, {A})}, nullptr);
  });
  REQUIRE(Kind == ErrorKind::InvalidInput);
}

TEST_CASE("dot output escapes identifiers") {
  const auto Backslash = NamedPoint{R"(C:\)"};
  const auto Quote = NamedPoint{R"(say "hi")"};
  const auto Network = Net<NamedPoint>{
      {makeNode(Backslash, {Quote}), makeNode(Quote, {Backslash})}};

  const auto Dot = fmt::format("{:d}", Network);
  REQUIRE(Dot.find(R"("C:\\" -> "say \"hi\"")") != std::string::npos);
  REQUIRE(Dot.find(R"("say \"hi\"" -> "C:\\")") != std::string::npos);
}

TEST_CASE("found paths are moved up the search, not copied") {
  constexpr auto NumPoints = 24;
  auto Nodes = std::vector<Node<CopyCountedPoint>>{};
  for (auto Id = 0; Id < NumPoints; ++Id) {
    auto Builder = NodeBuilder<CopyCountedPoint>{};
    Builder.setPoint(CopyCountedPoint{Id});
    if (Id + 1 < NumPoints) {
      Builder.addConnection(CopyCountedPoint{Id + 1});
    }
    Nodes.push_back(Builder.build());
  }
  const auto Network = Net<CopyCountedPoint>{std::move(Nodes)};
  const auto From = CopyCountedPoint{0};
  const auto To = CopyCountedPoint{NumPoints - 1};

  CopyCountedPoint::Copies = 0U;
  const auto Paths = Network.findPaths(From, To);
  REQUIRE(Paths.size() == 1U);
  REQUIRE(Paths.front().size() == static_cast<std::size_t>(NumPoints));

  // growing the route copies it once per step. Copying the finished path
  // into every enclosing level would add another NumSteps * NumPoints.
  constexpr auto NumSteps = static_cast<std::size_t>(NumPoints - 1);
  INFO(fmt::format("copies: {}", CopyCountedPoint::Copies));
  REQUIRE(CopyCountedPoint::Copies < NumSteps * NumSteps);
}
