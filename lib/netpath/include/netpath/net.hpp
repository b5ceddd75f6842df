#ifndef netpath_lib_netpath_include_netpath_net_hpp
#define netpath_lib_netpath_include_netpath_net_hpp

#include <concepts>
#include <cstddef>
#include <memory>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <boost/algorithm/string/replace.hpp>
#include <boost/container/flat_set.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <oneapi/tbb/parallel_for.h>
#include <range/v3/action/push_back.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/fold_left.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/for_each.hpp>
#include <range/v3/view/join.hpp>
#include <range/v3/view/move.hpp>
#include <range/v3/view/transform.hpp>
#include <spdlog/spdlog.h>

#include "netpath/config.hpp"
#include "netpath/node.hpp"
#include "netpath/path.hpp"
#include "netpath/point.hpp"
#include "support/netpath_exception.hpp"

// The nodes of a net. Connections name their targets by point, so every
// target of every connection is expected to have a node of its own.
template <Point PointType> class Net {
public:
  using NodeType = Node<PointType>;
  using PathType = Path<PointType>;

  explicit Net(std::vector<NodeType> Nodes,
               std::shared_ptr<Config> Conf = std::make_shared<Config>())
      : Nodes_{std::move(Nodes)},
        Conf_{std::move(Conf)} {
    NetPathException::verify(Conf_ != nullptr, ErrorKind::InvalidInput,
                             "A net needs a config");
    verifyUniquePoints();
  }

  [[nodiscard]] const NodeType *findNode(const PointType &Val) const {
    const auto Iter = ranges::find_if(
        Nodes_, [&Val](const NodeType &Entry) { return Entry.pointIs(Val); });
    if (Iter == Nodes_.end()) {
      return nullptr;
    }
    return &*Iter;
  }

  [[nodiscard]] bool contains(const PointType &Val) const {
    return findNode(Val) != nullptr;
  }

  [[nodiscard]] const std::vector<NodeType> &getNodes() const {
    return Nodes_;
  }

  [[nodiscard]] std::size_t size() const { return Nodes_.size(); }

  [[nodiscard]] std::size_t countConnections() const {
    return ranges::fold_left(
        Nodes_, std::size_t{0U},
        [](const std::size_t Count, const NodeType &Entry) {
          return Count + Entry.getConnections().size();
        });
  }

  [[nodiscard]] const Config &getConfig() const { return *Conf_; }

  // Every simple path from From to To, in the order the depth-first search
  // reaches them (connection insertion order at each node).
  [[nodiscard]] std::vector<PathType> findPaths(const PointType &From,
                                                const PointType &To) const {
    const auto &FromNode = findNodeOrRaise(From);
    std::ignore = findNodeOrRaise(To);

    auto Paths = search(FromNode, To, seedPath(From), 0U);
    NetPathException::check(!Paths.empty(), ErrorKind::NoPathFound,
                            "No path found between points {} and {}",
                            From.getIdentifier(), To.getIdentifier());

    spdlog::debug("findPaths: {} path(s) from {} to {}", Paths.size(),
                  From.getIdentifier(), To.getIdentifier());
    return Paths;
  }

private:
  [[nodiscard]] const NodeType &findNodeOrRaise(const PointType &Val) const {
    const auto *const Found = findNode(Val);
    NetPathException::check(Found != nullptr, ErrorKind::PointNotFound,
                            R"(The point with id "{}" could not be found)",
                            Val.getIdentifier());
    return *Found;
  }

  // Lookup of a connection target. A target without a node means the net
  // was assembled from mismatched data.
  [[nodiscard]] const NodeType &nodeOf(const PointType &Target) const {
    const auto *const Found = findNode(Target);
    NetPathException::verify(
        Found != nullptr, ErrorKind::InconsistentNet,
        "A connection points to {}, which has no node in the net",
        Target.getIdentifier());
    return *Found;
  }

  [[nodiscard]] static PathType seedPath(const PointType &From) {
    try {
      return PathBuilder<PointType>{}.addPoint(From).build();
    } catch (const NetPathException &Ex) {
      NetPathException::fail(ErrorKind::PathCannotBeBuilt,
                             "Could not start a path at {}: {}",
                             From.getIdentifier(), Ex.what());
    }
  }

  [[nodiscard]] std::vector<PathType> search(const NodeType &Current,
                                             const PointType &Destination,
                                             const PathType &Route,
                                             const std::size_t Depth) const {
    if (Route.endsWith(Destination)) {
      spdlog::trace("search: reached {} via {}", Destination.getIdentifier(),
                    Route);
      return {Route};
    }

    const auto Candidates = Current.getConnectedPointsNotIn(Route);
    if (!Candidates) {
      spdlog::trace("search: dead end at {}", Route);
      return {};
    }

    const auto Explore = [this, &Destination, &Route,
                          Depth](const PointType &Candidate) {
      return search(nodeOf(Candidate), Destination, Route.extendedBy(Candidate),
                    Depth + 1U);
    };

    if (Conf_->EnableParallelSearch && Depth < Conf_->MaxParallelDepth &&
        Candidates->size() > 1U) {
      // one slot per branch keeps the result order of the sequential search
      auto BranchResults = std::vector<std::vector<PathType>>(
          Candidates->size());
      tbb::parallel_for(std::size_t{0U}, Candidates->size(),
                        [&BranchResults, &Candidates,
                         &Explore](const std::size_t BranchIndex) {
                          BranchResults[BranchIndex] =
                              Explore((*Candidates)[BranchIndex]);
                        });
      return BranchResults | ranges::views::join | ranges::views::move |
             ranges::to<std::vector<PathType>>;
    }

    return ranges::fold_left(
        *Candidates, std::vector<PathType>{},
        [&Explore](std::vector<PathType> Found, const PointType &Candidate) {
          auto Branch = Explore(Candidate);
          return std::move(Found) |
                 ranges::actions::push_back(Branch | ranges::views::move);
        });
  }

  void verifyUniquePoints() const {
    const auto Report = [](const PointType &Duplicate) {
      NetPathException::raise(ErrorKind::DuplicatePoint,
                              "The point {} has more than one node",
                              Duplicate.getIdentifier());
    };

    if constexpr (std::totally_ordered<IdentifierType<PointType>>) {
      auto Seen = boost::container::flat_set<IdentifierType<PointType>>{};
      Seen.reserve(Nodes_.size());
      for (const auto &Entry : Nodes_) {
        if (const auto [_, Inserted] =
                Seen.insert(Entry.getPoint().getIdentifier());
            !Inserted) {
          Report(Entry.getPoint());
        }
      }
    } else {
      for (auto Iter = Nodes_.begin(); Iter != Nodes_.end(); ++Iter) {
        const auto &Subject = Iter->getPoint();
        if (ranges::find_if(Nodes_.begin(), Iter,
                            [&Subject](const NodeType &Previous) {
                              return Previous.pointIs(Subject);
                            }) != Iter) {
          Report(Subject);
        }
      }
    }
  }

  std::vector<NodeType> Nodes_;
  std::shared_ptr<Config> Conf_;
};

template <Point PointType> class fmt::formatter<Net<PointType>> {
public:
  // NOLINTBEGIN(readability-convert-member-functions-to-static)
  [[nodiscard]] constexpr format_parse_context::iterator
  parse(format_parse_context &Ctx) {
    auto Iter = Ctx.begin();
    const auto End = Ctx.end();
    if (Iter != End && (*Iter == 'd' || *Iter == 's')) {
      Presentation_ = *Iter++;
      Ctx.advance_to(Iter);
    }
    return Iter;
  }

  [[nodiscard]] format_context::iterator format(const Net<PointType> &Val,
                                                format_context &Ctx) const {
    switch (Presentation_) {
    case 'd':
      return fmt::format_to(Ctx.out(), "{}", toDotFormat(Val));
    case 's':
      return fmt::format_to(Ctx.out(), "|V| = {}, |E| = {}", Val.size(),
                            Val.countConnections());
    }
    return fmt::format_to(Ctx.out(), "{}", fmt::join(Val.getNodes(), "\n"));
  }
  // NOLINTEND(readability-convert-member-functions-to-static)

private:
  [[nodiscard]] static std::string toDotFormat(const Net<PointType> &Val) {
    const auto Quoted = [](const PointType &Subject) {
      auto Name = fmt::format("{}", Subject.getIdentifier());
      boost::replace_all(Name, "\\", "\\\\");
      boost::replace_all(Name, "\"", "\\\"");
      return fmt::format("\"{}\"", Name);
    };

    const auto VertexToString = [&Quoted](const Node<PointType> &Entry) {
      return fmt::format("  {}", Quoted(Entry.getPoint()));
    };

    const auto EdgesToString = [&Quoted](const Node<PointType> &Entry) {
      return Entry.getConnections() |
             ranges::views::transform(
                 [&Quoted, Source = Quoted(Entry.getPoint())](
                     const Connection<PointType> &Conn) {
                   return fmt::format("  {} -> {}", Source,
                                      Quoted(Conn.getTarget()));
                 });
    };

    return fmt::format(
        "digraph D {{\n{}\n\n{}\n}}\n",
        fmt::join(Val.getNodes() | ranges::views::transform(VertexToString),
                  "\n"),
        fmt::join(Val.getNodes() | ranges::views::for_each(EdgesToString),
                  "\n"));
  }

  char Presentation_{};
};

#endif
