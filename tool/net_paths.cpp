#include <algorithm>
#include <compare>
#include <exception>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/Signals.h>
#include <range/v3/action/sort.hpp>
#include <range/v3/algorithm/for_each.hpp>
#include <range/v3/iterator/operations.hpp>
#include <range/v3/range/access.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/chunk_by.hpp>
#include <range/v3/view/enumerate.hpp>
#include <range/v3/view/take.hpp>
#include <range/v3/view/transform.hpp>
#include <spdlog/cfg/env.h>
#include <spdlog/common.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include "netpath/config.hpp"
#include "netpath/named_point.hpp"
#include "netpath/net.hpp"
#include "netpath/net_description.hpp"
#include "netpath/path.hpp"
#include "support/netpath_exception.hpp"

// NOLINTBEGIN
using namespace llvm::cl;

static OptionCategory ToolCategory("net_paths");
const static opt<std::string> NetPath(Positional, desc("<net file>"), Required,
                                      cat(ToolCategory));
const static opt<std::string> From("from", desc("Identifier of the start point"),
                                   ValueRequired, Required, cat(ToolCategory));
const static opt<std::string> To("to", desc("Identifier of the end point"),
                                 ValueRequired, Required, cat(ToolCategory));
const static opt<std::string> ConfigPath("config", desc("Config file path"),
                                         ValueRequired, cat(ToolCategory));
const static opt<std::string>
    DotPath("dot", desc("Write the net in graphviz format to this file"),
            ValueRequired, cat(ToolCategory));
const static opt<bool> Verbose("v", desc("Verbose output"), cat(ToolCategory));
// NOLINTEND

namespace {
using PathType = Path<NamedPoint>;

void reportPaths(std::vector<PathType> Paths, const Config &Conf) {
  Paths |= ranges::actions::sort([&Conf](const PathType &Lhs,
                                         const PathType &Rhs) {
    if (const auto Comp = Lhs.size() <=> Rhs.size(); std::is_neq(Comp)) {
      return std::is_lt(Comp);
    }
    return Lhs.render(Conf.PathSeparator) < Rhs.render(Conf.PathSeparator);
  });

  spdlog::info("found {} paths", Paths.size());
  spdlog::info(
      "path length distribution: {}",
      Paths |
          ranges::views::chunk_by([](const PathType &Lhs, const PathType &Rhs) {
            return Lhs.size() == Rhs.size();
          }) |
          ranges::views::transform([](const auto Range) {
            return std::pair{ranges::begin(Range)->size(),
                             ranges::distance(Range)};
          }));

  const auto OutputPathCount =
      std::min<std::size_t>(Paths.size(), Conf.MaxPathOutputCount);
  ranges::for_each(Paths | ranges::views::enumerate |
                       ranges::views::take(OutputPathCount),
                   [&Conf](const auto IndexedPath) {
                     const auto &[Number, Route] = IndexedPath;
                     spdlog::info("path #{}: {}", Number,
                                  Route.render(Conf.PathSeparator));
                   });
}
} // namespace

int main(int argc, const char **argv) {
  llvm::sys::PrintStackTraceOnErrorSignal(argv[0]);

  spdlog::cfg::load_env_levels();

  HideUnrelatedOptions(ToolCategory);
  if (!ParseCommandLineOptions(argc, argv, "find all simple paths in a net")) {
    return 1;
  }

  try {
    auto FileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        "net_paths_log.txt");
    FileSink->set_level(spdlog::level::trace);
    spdlog::default_logger()->sinks().push_back(FileSink);

    if (Verbose) {
      spdlog::set_level(spdlog::level::trace);
    }

    const auto ConfigFilePath = std::filesystem::path{ConfigPath.getValue()};
    auto Conf = std::make_shared<Config>(
        ConfigFilePath.empty() ? Config{} : Config::parse(ConfigFilePath));
    spdlog::debug("config:\n{}", *Conf);

    const auto Network =
        toNet(NetDescription::parse(NetPath.getValue()), Conf);
    spdlog::info("net size: {:s}", Network);

    if (!DotPath.getValue().empty()) {
      saveDot(Network, DotPath.getValue());
    }

    reportPaths(Network.findPaths(NamedPoint{From.getValue()},
                                  NamedPoint{To.getValue()}),
                *Conf);
  } catch (const NetPathException &Ex) {
    spdlog::error("{}: {}", Ex.getKind(), Ex.what());
    return 1;
  } catch (const std::exception &Ex) {
    spdlog::error("{}", Ex.what());
    return 1;
  }

  return 0;
}
