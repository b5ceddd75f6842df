#ifndef netpath_lib_netpath_include_netpath_net_description_hpp
#define netpath_lib_netpath_include_netpath_net_description_hpp

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "netpath/config.hpp"
#include "netpath/named_point.hpp"
#include "netpath/net.hpp"

// On-disk form of a net:
//
//   Nodes:
//     - Point: A
//       Connections: [B, D]
//
// Connections are directed. An undirected edge is listed on both of its
// points.
struct NodeDescription {
  std::string Point;
  std::vector<std::string> Connections;
};

struct NetDescription {
  [[nodiscard]] static NetDescription parse(const std::filesystem::path &File);
  [[nodiscard]] static NetDescription parseString(std::string_view Data);

  void save(const std::filesystem::path &File) const;

  // NOLINTNEXTLINE(misc-non-private-member-variables-in-classes)
  std::vector<NodeDescription> Nodes;
};

[[nodiscard]] Net<NamedPoint>
toNet(const NetDescription &Description,
      std::shared_ptr<Config> Conf = std::make_shared<Config>());

[[nodiscard]] NetDescription toDescription(const Net<NamedPoint> &Network);

// Writes the net in graphviz dot format.
void saveDot(const Net<NamedPoint> &Network, const std::filesystem::path &File);

#endif
