#include <cstddef>

#include "netpath_benchmarks.hpp"
#include "support/testcase_generation.hpp"

// NOLINTNEXTLINE
GENERATE_GENERATED_BENCHMARKS(
    straightNet,
    GenerateStraightNet, ->Range(1, size_t{1U} << size_t{10U})->Complexity());

// NOLINTNEXTLINE
GENERATE_GENERATED_BENCHMARKS(
    forkingNet, GenerateForkingNet, ->DenseRange(1, 12, 1)->Complexity());

// NOLINTNEXTLINE
GENERATE_GENERATED_BENCHMARKS(
    completeNet, GenerateCompleteNet, ->DenseRange(2, 9, 1)->Complexity());
