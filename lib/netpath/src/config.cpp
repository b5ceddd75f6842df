#include "netpath/config.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <string>
#include <system_error>

#include <fmt/core.h>
#include <fmt/std.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>
#include <range/v3/algorithm/for_each.hpp>
#include <range/v3/range/concepts.hpp>
#include <range/v3/utility/tuple_algorithm.hpp>
#include <spdlog/spdlog.h>

#include "support/netpath_exception.hpp"

Config Config::parse(const std::filesystem::path &File) {
  NetPathException::check(std::filesystem::exists(File),
                          ErrorKind::InvalidInput,
                          "Config file does not exist ({})", File);

  auto FileStream = std::ifstream{File};
  const auto FileData = std::string{std::istreambuf_iterator<char>{FileStream},
                                    std::istreambuf_iterator<char>{}};
  auto Input = llvm::yaml::Input{FileData};
  auto Conf = Config{};
  Input >> Conf;

  const auto Error = Input.error();
  NetPathException::check(!Error, ErrorKind::InvalidInput,
                          "Failed to parse config file: {}", Error.message());
  spdlog::debug("loaded config from {}", File);
  return Conf;
}

void Config::save(const std::filesystem::path &File) const {
  auto Error = std::error_code{};
  const auto FileName = File.string();
  auto FileStream = llvm::raw_fd_ostream{FileName, Error};
  NetPathException::check(!Error, ErrorKind::InvalidInput,
                          "Error while opening config file: {}",
                          Error.message());
  auto OutStream = llvm::yaml::Output{FileStream};
  // yaml::Output takes a mutable reference
  auto Conf = *this;
  OutStream << Conf;
}

void llvm::yaml::MappingTraits<Config>::mapping(llvm::yaml::IO &YamlIO,
                                                Config &Conf) {
  const auto MapOptionals = [&Conf,
                             &YamlIO](const ranges::range auto &Mappings) {
    const auto MapOptional =
        [&Conf, &YamlIO]<typename ValueType>(
            const Config::MappingType<ValueType> &MappingValue) {
          const auto &[ValueName, ValueAddress] = MappingValue;
          YamlIO.mapOptional(ValueName.data(), std::invoke(ValueAddress, Conf));
        };

    ranges::for_each(Mappings, MapOptional);
  };

  ranges::tuple_for_each(Config::getConfigMapping(), MapOptionals);
}

fmt::format_context::iterator
fmt::formatter<Config>::format(const Config &Conf,
                               fmt::format_context &Ctx) const {
  std::string Str;
  llvm::raw_string_ostream Stream{Str};
  auto OutStream = llvm::yaml::Output{Stream};
  auto Mutable = Conf;
  OutStream << Mutable;
  Stream.flush();
  return fmt::format_to(Ctx.out(), "{}", Str);
}
