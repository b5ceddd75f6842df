#include <cstddef>
#include <memory>

#include <catch2/catch_test_macros.hpp>
#include <range/v3/algorithm/for_each.hpp>
#include <range/v3/view/indices.hpp>

#include "netpath/config.hpp"
#include "netpath_tests.hpp"
#include "support/testcase_generation.hpp"

namespace {
// simple paths between two fixed points of a complete net with NumPoints
// points: sum over k of (NumPoints - 2)! / (NumPoints - 2 - k)!
[[nodiscard]] std::size_t completeNetPathCount(const std::size_t NumPoints) {
  const auto Inner = NumPoints - 2U;
  auto Count = std::size_t{0U};
  auto Arrangements = std::size_t{1U};
  for (auto Length = std::size_t{0U}; Length <= Inner; ++Length) {
    Count += Arrangements;
    Arrangements *= Inner - Length;
  }
  return Count;
}
} // namespace

TEST_CASE("generated straight net") {
  ranges::for_each(ranges::views::indices(std::size_t{1U}, std::size_t{20U}),
                   [](const std::size_t NumRepetitions) {
                     testPathCount(GenerateStraightNet, NumRepetitions, 1U);
                   });
}

TEST_CASE("generated forking net") {
  ranges::for_each(ranges::views::indices(std::size_t{1U}, std::size_t{10U}),
                   [](const std::size_t NumRepetitions) {
                     testPathCount(GenerateForkingNet, NumRepetitions,
                                   std::size_t{1U} << NumRepetitions);
                   });
}

TEST_CASE("generated complete net") {
  REQUIRE(completeNetPathCount(4U) == 5U);
  REQUIRE(completeNetPathCount(6U) == 65U);

  ranges::for_each(ranges::views::indices(std::size_t{2U}, std::size_t{8U}),
                   [](const std::size_t NumRepetitions) {
                     testPathCount(GenerateCompleteNet, NumRepetitions,
                                   completeNetPathCount(NumRepetitions));
                   });
}
