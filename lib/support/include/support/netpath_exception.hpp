#ifndef netpath_lib_support_include_support_netpath_exception_hpp
#define netpath_lib_support_include_support_netpath_exception_hpp

#include <array>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "support/enum_mappings.hpp"

enum class ErrorKind {
  MissingPoint,
  SelfConnection,
  EmptyPath,
  PointNotFound,
  NoPathFound,
  PathCannotBeBuilt,
  DuplicatePoint,
  InvalidInput,
  InconsistentNet,
};

template <> [[nodiscard]] constexpr auto enumeration<ErrorKind>() {
  using Mapping = EnumerationMappingType<ErrorKind>;
  return std::array{
      Mapping{"MissingPoint", ErrorKind::MissingPoint},
      Mapping{"SelfConnection", ErrorKind::SelfConnection},
      Mapping{"EmptyPath", ErrorKind::EmptyPath},
      Mapping{"PointNotFound", ErrorKind::PointNotFound},
      Mapping{"NoPathFound", ErrorKind::NoPathFound},
      Mapping{"PathCannotBeBuilt", ErrorKind::PathCannotBeBuilt},
      Mapping{"DuplicatePoint", ErrorKind::DuplicatePoint},
      Mapping{"InvalidInput", ErrorKind::InvalidInput},
      Mapping{"InconsistentNet", ErrorKind::InconsistentNet},
  };
}

template <> class fmt::formatter<ErrorKind> {
public:
  // NOLINTBEGIN(readability-convert-member-functions-to-static)
  [[nodiscard]] constexpr format_parse_context::iterator
  parse(format_parse_context &Ctx) {
    return Ctx.begin();
  }

  [[nodiscard]] format_context::iterator format(const ErrorKind Val,
                                                format_context &Ctx) const {
    return fmt::format_to(Ctx.out(), "{}", toStringView(Val));
  }
  // NOLINTEND(readability-convert-member-functions-to-static)
};

// Recoverable errors (bad builder input, unknown points, no route) go through
// raise/check and are logged at debug level. Broken invariants go through
// fail/verify, which log at error level and dump the backtrace buffer.
class NetPathException : public std::exception {
public:
  NetPathException(const ErrorKind Kind, std::string Message)
      : Kind_{Kind},
        Message_(std::move(Message)) {}

  template <typename... Ts>
  NetPathException(const ErrorKind Kind, const std::string_view FormatString,
                   Ts &&...Args)
      : NetPathException{Kind, fmt::format(fmt::runtime(FormatString),
                                           std::forward<Ts>(Args)...)} {}

  [[nodiscard]] const char *what() const noexcept final {
    return Message_.c_str();
  }

  [[nodiscard]] ErrorKind getKind() const noexcept { return Kind_; }

  template <typename... Ts>
  [[noreturn]] static void raise(const ErrorKind Kind,
                                 const std::string_view FormatString,
                                 Ts &&...Args) {
    auto Exception =
        NetPathException{Kind, FormatString, std::forward<Ts>(Args)...};
    spdlog::debug("{}: {}", Kind, Exception.Message_);
    throw Exception;
  }

  template <typename... Ts>
  static void check(const bool Condition, const ErrorKind Kind,
                    const std::string_view FormatString, Ts &&...Args) {
    if (!Condition) {
      raise(Kind, FormatString, std::forward<Ts>(Args)...);
    }
  }

  template <typename... Ts>
  [[noreturn]] static void fail(const ErrorKind Kind,
                                const std::string_view FormatString,
                                Ts &&...Args) {
    auto Exception =
        NetPathException{Kind, FormatString, std::forward<Ts>(Args)...};
    spdlog::error("{}: {}", Kind, Exception.Message_);
    spdlog::dump_backtrace();
    throw Exception;
  }

  template <typename... Ts>
  static void verify(const bool Condition, const ErrorKind Kind,
                     const std::string_view FormatString, Ts &&...Args) {
    if (!Condition) {
      fail(Kind, FormatString, std::forward<Ts>(Args)...);
    }
  }

private:
  ErrorKind Kind_;
  std::string Message_;
};

#endif
