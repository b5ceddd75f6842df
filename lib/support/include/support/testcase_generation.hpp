#ifndef netpath_lib_support_include_support_testcase_generation_hpp
#define netpath_lib_support_include_support_testcase_generation_hpp

#include <cstddef>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/concat.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/indices.hpp>
#include <range/v3/view/transform.hpp>

// A net in the YAML net file format together with the query to run on it.
struct GeneratedNet {
  std::string From;
  std::string To;
  std::string Yaml;
};

[[nodiscard]] inline std::string
toYamlNode(const std::string &Point,
           const std::vector<std::string> &Connections) {
  return fmt::format("  - Point: {}\n    Connections: [{}]", Point,
                     fmt::join(Connections, ", "));
}

[[nodiscard]] inline std::string
toYamlNet(const std::vector<std::string> &YamlNodes) {
  return fmt::format("Nodes:\n{}\n", fmt::join(YamlNodes, "\n"));
}

// P0 - P1 - ... - PN, exactly one path from P0 to PN
inline const auto GenerateStraightNet = [](const std::size_t NumRepetitions) {
  const auto Name = [](const std::size_t Iter) {
    return fmt::format("P{}", Iter);
  };
  const auto ToNode = [&Name, NumRepetitions](const std::size_t Iter) {
    auto Neighbours = std::vector<std::string>{};
    if (Iter > 0U) {
      Neighbours.push_back(Name(Iter - 1U));
    }
    if (Iter < NumRepetitions) {
      Neighbours.push_back(Name(Iter + 1U));
    }
    return toYamlNode(Name(Iter), Neighbours);
  };
  return GeneratedNet{
      Name(0U), Name(NumRepetitions),
      toYamlNet(ranges::views::indices(NumRepetitions + 1U) |
                ranges::views::transform(ToNode) | ranges::to_vector)};
};

// A0 <B0|C0> A1 <B1|C1> ... AN, a chain of diamonds with 2^N paths from A0
// to AN
inline const auto GenerateForkingNet = [](const std::size_t NumRepetitions) {
  const auto Hub = [](const std::size_t Iter) {
    return fmt::format("A{}", Iter);
  };
  const auto ToHub = [&Hub, NumRepetitions](const std::size_t Iter) {
    auto Neighbours = std::vector<std::string>{};
    if (Iter > 0U) {
      Neighbours.push_back(fmt::format("B{}", Iter - 1U));
      Neighbours.push_back(fmt::format("C{}", Iter - 1U));
    }
    if (Iter < NumRepetitions) {
      Neighbours.push_back(fmt::format("B{}", Iter));
      Neighbours.push_back(fmt::format("C{}", Iter));
    }
    return toYamlNode(Hub(Iter), Neighbours);
  };
  const auto ToFork = [&Hub](const std::size_t ForkIndex) {
    const auto Iter = ForkIndex / 2U;
    const auto Name = ForkIndex % 2U == 0U ? 'B' : 'C';
    return toYamlNode(fmt::format("{}{}", Name, Iter),
                      {Hub(Iter), Hub(Iter + 1U)});
  };
  return GeneratedNet{
      Hub(0U), Hub(NumRepetitions),
      toYamlNet(ranges::views::concat(
                    ranges::views::indices(NumRepetitions + 1U) |
                        ranges::views::transform(ToHub),
                    ranges::views::indices(NumRepetitions * 2U) |
                        ranges::views::transform(ToFork)) |
                ranges::to_vector)};
};

// every point connected to every other point, NumRepetitions >= 2
inline const auto GenerateCompleteNet = [](const std::size_t NumRepetitions) {
  const auto Name = [](const std::size_t Iter) {
    return fmt::format("P{}", Iter);
  };
  const auto ToNode = [&Name, NumRepetitions](const std::size_t Iter) {
    return toYamlNode(Name(Iter),
                      ranges::views::indices(NumRepetitions) |
                          ranges::views::filter(
                              [Iter](const std::size_t Other) {
                                return Other != Iter;
                              }) |
                          ranges::views::transform(Name) | ranges::to_vector);
  };
  return GeneratedNet{
      Name(0U), Name(NumRepetitions - 1U),
      toYamlNet(ranges::views::indices(NumRepetitions) |
                ranges::views::transform(ToNode) | ranges::to_vector)};
};

#endif
