#include "netpath/net_description.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/os.h>
#include <fmt/std.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>
#include <spdlog/spdlog.h>

#include "netpath/config.hpp"
#include "netpath/named_point.hpp"
#include "netpath/net.hpp"
#include "netpath/node.hpp"
#include "support/netpath_exception.hpp"
#include "support/ranges/functional.hpp"

LLVM_YAML_IS_FLOW_SEQUENCE_VECTOR(std::string)
LLVM_YAML_IS_SEQUENCE_VECTOR(NodeDescription)

template <> struct llvm::yaml::MappingTraits<NodeDescription> {
  static void mapping(llvm::yaml::IO &YamlIO, NodeDescription &Description) {
    YamlIO.mapRequired("Point", Description.Point);
    YamlIO.mapOptional("Connections", Description.Connections);
  }

  static std::string validate(llvm::yaml::IO & /*YamlIO*/,
                              NodeDescription &Description) {
    if (Description.Point.empty()) {
      return "a node needs a non-empty Point";
    }
    return {};
  }
};

template <> struct llvm::yaml::MappingTraits<NetDescription> {
  static void mapping(llvm::yaml::IO &YamlIO, NetDescription &Description) {
    YamlIO.mapRequired("Nodes", Description.Nodes);
  }
};

NetDescription NetDescription::parse(const std::filesystem::path &File) {
  NetPathException::check(std::filesystem::exists(File),
                          ErrorKind::InvalidInput,
                          "Net file does not exist ({})", File);

  auto FileStream = std::ifstream{File};
  const auto FileData = std::string{std::istreambuf_iterator<char>{FileStream},
                                    std::istreambuf_iterator<char>{}};
  return parseString(FileData);
}

NetDescription NetDescription::parseString(const std::string_view Data) {
  auto Input = llvm::yaml::Input{llvm::StringRef{Data.data(), Data.size()}};
  auto Description = NetDescription{};
  Input >> Description;

  const auto Error = Input.error();
  NetPathException::check(!Error, ErrorKind::InvalidInput,
                          "Failed to parse net description: {}",
                          Error.message());
  return Description;
}

void NetDescription::save(const std::filesystem::path &File) const {
  auto Error = std::error_code{};
  const auto FileName = File.string();
  auto FileStream = llvm::raw_fd_ostream{FileName, Error};
  NetPathException::check(!Error, ErrorKind::InvalidInput,
                          "Error while opening net file: {}", Error.message());
  auto OutStream = llvm::yaml::Output{FileStream};
  auto Mutable = *this;
  OutStream << Mutable;
}

Net<NamedPoint> toNet(const NetDescription &Description,
                      std::shared_ptr<Config> Conf) {
  const auto ToNode = [](const NodeDescription &Entry) {
    return NodeBuilder<NamedPoint>{}
        .setPoint(NamedPoint{Entry.Point})
        .addConnections(Entry.Connections |
                        ranges::views::transform(Construct<NamedPoint>))
        .build();
  };

  auto Network =
      Net<NamedPoint>{Description.Nodes | ranges::views::transform(ToNode) |
                          ranges::to_vector,
                      std::move(Conf)};
  spdlog::debug("loaded net: {:s}", Network);
  return Network;
}

NetDescription toDescription(const Net<NamedPoint> &Network) {
  const auto ToDescription = [](const Node<NamedPoint> &Entry) {
    return NodeDescription{
        Entry.getPoint().getIdentifier(),
        Entry.getConnections() |
            ranges::views::transform([](const Connection<NamedPoint> &Conn) {
              return Conn.getTarget().getIdentifier();
            }) |
            ranges::to<std::vector<std::string>>};
  };

  return NetDescription{Network.getNodes() |
                        ranges::views::transform(ToDescription) |
                        ranges::to_vector};
}

void saveDot(const Net<NamedPoint> &Network,
             const std::filesystem::path &File) {
  try {
    auto DotFile = fmt::output_file(File.string());
    DotFile.print("{:d}", Network);
  } catch (const std::system_error &Ex) {
    NetPathException::raise(ErrorKind::InvalidInput,
                            "Could not write dot file {}: {}", File, Ex.what());
  }
}
