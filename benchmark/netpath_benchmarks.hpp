#ifndef netpath_benchmark_netpath_benchmarks_hpp
#define netpath_benchmark_netpath_benchmarks_hpp

#include <cstdint>
#include <memory>
#include <string>

#include <benchmark/benchmark.h>

#include "netpath/config.hpp"
#include "netpath/named_point.hpp"
#include "netpath/net.hpp"
#include "netpath/net_description.hpp"

inline void setupCounters(benchmark::State &State, const Net<NamedPoint> &Network,
                          const NamedPoint &From, const NamedPoint &To) {
  State.counters["points"] = static_cast<double>(Network.size());
  State.counters["connections"] =
      static_cast<double>(Network.countConnections());
  State.counters["paths"] =
      static_cast<double>(Network.findPaths(From, To).size());
}

[[nodiscard]] inline std::shared_ptr<Config> makeParallelConfig() {
  auto Conf = std::make_shared<Config>();
  Conf->EnableParallelSearch = true;
  return Conf;
}

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define SETUP_BENCHMARK(Yaml, FromName, ToName)                                \
  const auto From = NamedPoint{FromName};                                      \
  const auto To = NamedPoint{ToName};                                          \
  const auto NetYaml = std::string{Yaml};                                      \
  const auto Description = NetDescription::parseString(NetYaml);               \
  const auto Network = toNet(Description);                                     \
  setupCounters(State, Network, From, To);

#define BENCHMARK_BODY_LOAD                                                    \
  {                                                                            \
    const auto Loaded = toNet(NetDescription::parseString(NetYaml));           \
    benchmark::DoNotOptimize(Loaded.getNodes().data());                        \
    benchmark::ClobberMemory();                                                \
  }

#define BENCHMARK_BODY_PATH_FINDING(Searched)                                  \
  {                                                                            \
    const auto Paths = (Searched).findPaths(From, To);                         \
    benchmark::DoNotOptimize(Paths.data());                                    \
    benchmark::ClobberMemory();                                                \
  }

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define GENERATE_GENERATED_BENCHMARKS(Name, Generator, Args)                   \
  /* NOLINTNEXTLINE(bugprone-macro-parentheses) */                             \
  using Name = benchmark::Fixture;                                             \
  BENCHMARK_DEFINE_F(Name, load)                                               \
  (benchmark::State & State) {                                                 \
    const auto [FromName, ToName, Yaml] =                                      \
        Generator(static_cast<size_t>(State.range(0)));                        \
    SETUP_BENCHMARK(Yaml, FromName, ToName);                                   \
    for (auto _ : State) {                                                     \
      BENCHMARK_BODY_LOAD                                                      \
    }                                                                          \
    State.SetComplexityN(                                                      \
        static_cast<std::int64_t>(State.counters["connections"]));             \
  }                                                                            \
  /* NOLINTNEXTLINE(bugprone-macro-parentheses) */                             \
  BENCHMARK_REGISTER_F(Name, load) Args;                                       \
  BENCHMARK_DEFINE_F(Name, path_finding)(benchmark::State & State) {           \
    const auto [FromName, ToName, Yaml] =                                      \
        Generator(static_cast<size_t>(State.range(0)));                        \
    SETUP_BENCHMARK(Yaml, FromName, ToName);                                   \
    for (auto _ : State) {                                                     \
      BENCHMARK_BODY_PATH_FINDING(Network)                                     \
    }                                                                          \
    State.SetComplexityN(static_cast<std::int64_t>(State.counters["paths"]));  \
  }                                                                            \
  /* NOLINTNEXTLINE(bugprone-macro-parentheses) */                             \
  BENCHMARK_REGISTER_F(Name, path_finding) Args;                               \
  BENCHMARK_DEFINE_F(Name, parallel_path_finding)                              \
  (benchmark::State & State) {                                                 \
    const auto [FromName, ToName, Yaml] =                                      \
        Generator(static_cast<size_t>(State.range(0)));                        \
    SETUP_BENCHMARK(Yaml, FromName, ToName);                                   \
    const auto ParallelNetwork = toNet(Description, makeParallelConfig());     \
    for (auto _ : State) {                                                     \
      BENCHMARK_BODY_PATH_FINDING(ParallelNetwork)                             \
    }                                                                          \
    State.SetComplexityN(static_cast<std::int64_t>(State.counters["paths"]));  \
  }                                                                            \
  /* NOLINTNEXTLINE(bugprone-macro-parentheses) */                             \
  BENCHMARK_REGISTER_F(Name, parallel_path_finding) Args;

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define GENERATE_BENCHMARKS(Name, Yaml, FromName, ToName)                      \
  /* NOLINTNEXTLINE(bugprone-macro-parentheses) */                             \
  using Name = benchmark::Fixture;                                             \
  BENCHMARK_DEFINE_F(Name, load)                                               \
  (benchmark::State & State) {                                                 \
    SETUP_BENCHMARK(Yaml, FromName, ToName);                                   \
    for (auto _ : State) {                                                     \
      BENCHMARK_BODY_LOAD                                                      \
    }                                                                          \
  }                                                                            \
  BENCHMARK_REGISTER_F(Name, load);                                            \
  BENCHMARK_DEFINE_F(Name, path_finding)                                       \
  (benchmark::State & State) {                                                 \
    SETUP_BENCHMARK(Yaml, FromName, ToName);                                   \
    for (auto _ : State) {                                                     \
      BENCHMARK_BODY_PATH_FINDING(Network)                                     \
    }                                                                          \
  }                                                                            \
  BENCHMARK_REGISTER_F(Name, path_finding);

#endif
