#ifndef netpath_lib_netpath_include_netpath_named_point_hpp
#define netpath_lib_netpath_include_netpath_named_point_hpp

#include <compare>
#include <string>
#include <utility>

// Point identified by its name, used for nets loaded from files.
class NamedPoint {
public:
  explicit NamedPoint(std::string Name) : Name_{std::move(Name)} {}

  [[nodiscard]] const std::string &getIdentifier() const { return Name_; }

  [[nodiscard]] friend auto operator<=>(const NamedPoint &,
                                        const NamedPoint &) = default;

private:
  std::string Name_;
};

#endif
