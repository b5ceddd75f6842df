#include "netpath_benchmarks.hpp"

// NOLINTNEXTLINE
GENERATE_BENCHMARKS(baseline, R"(
Nodes:
  - Point: A
    Connections: [B]
  - Point: B
)",
                    "A", "B");

// NOLINTNEXTLINE
GENERATE_BENCHMARKS(meshed, R"(
Nodes:
  - Point: A
    Connections: [B, D]
  - Point: B
    Connections: [A, C, D]
  - Point: C
    Connections: [B, D]
  - Point: D
    Connections: [A, B, C]
)",
                    "A", "C");

// NOLINTNEXTLINE
GENERATE_BENCHMARKS(rail_network, R"(
Nodes:
  - Point: Amsterdam
    Connections: [Brussels, Cologne, Hamburg]
  - Point: Brussels
    Connections: [Amsterdam, Cologne, Paris, Luxembourg]
  - Point: Cologne
    Connections: [Amsterdam, Brussels, Frankfurt, Hamburg]
  - Point: Frankfurt
    Connections: [Cologne, Luxembourg, Munich, Strasbourg, Berlin]
  - Point: Hamburg
    Connections: [Amsterdam, Cologne, Berlin, Copenhagen]
  - Point: Berlin
    Connections: [Hamburg, Frankfurt, Munich, Prague]
  - Point: Munich
    Connections: [Frankfurt, Berlin, Prague, Vienna, Zurich]
  - Point: Prague
    Connections: [Berlin, Munich, Vienna]
  - Point: Vienna
    Connections: [Munich, Prague]
  - Point: Paris
    Connections: [Brussels, Luxembourg, Strasbourg, Zurich]
  - Point: Luxembourg
    Connections: [Brussels, Frankfurt, Paris]
  - Point: Strasbourg
    Connections: [Frankfurt, Paris, Zurich]
  - Point: Zurich
    Connections: [Munich, Paris, Strasbourg]
  - Point: Copenhagen
    Connections: [Hamburg]
)",
                    "Amsterdam", "Vienna");
