#ifndef netpath_lib_netpath_include_netpath_config_hpp
#define netpath_lib_netpath_include_netpath_config_hpp

#include <array>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

#include <fmt/core.h>
#include <llvm/Support/YAMLTraits.h>

class Config {
public:
  template <typename ValueType>
  using MappingType = std::pair<std::string_view, ValueType Config::*>;

  using BooleanMappingType = MappingType<bool>;
  using SizeTMappingType = MappingType<std::size_t>;
  using StringMappingType = MappingType<std::string>;

  [[nodiscard]] static consteval auto getConfigMapping() {
    return std::tuple{
        std::array{
            BooleanMappingType{"EnableParallelSearch",
                               &Config::EnableParallelSearch},
        },
        std::array{
            SizeTMappingType{"MaxParallelDepth", &Config::MaxParallelDepth},
            SizeTMappingType{"MaxPathOutputCount", &Config::MaxPathOutputCount},
        },
        std::array{
            StringMappingType{"PathSeparator", &Config::PathSeparator},
        }};
  }

  [[nodiscard]] static Config parse(const std::filesystem::path &File);

  void save(const std::filesystem::path &File) const;

  // NOLINTBEGIN(misc-non-private-member-variables-in-classes)
  bool EnableParallelSearch = false;

  // recursion levels whose branches are fanned out when searching in parallel
  std::size_t MaxParallelDepth = 2U;
  std::size_t MaxPathOutputCount = 10U;

  std::string PathSeparator = "-";
  // NOLINTEND(misc-non-private-member-variables-in-classes)
};

template <> struct llvm::yaml::MappingTraits<Config> {
  static void mapping(llvm::yaml::IO &YamlIO, Config &Conf);
};

template <> class fmt::formatter<Config> {
public:
  [[nodiscard]] constexpr format_parse_context::iterator
  parse(format_parse_context &Ctx) {
    return Ctx.begin();
  }

  [[nodiscard]] format_context::iterator format(const Config &Conf,
                                                format_context &Ctx) const;
};

#endif
