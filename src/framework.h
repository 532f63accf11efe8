#pragma once

#include <compare>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace refpack {

struct framework_version {
  int major{ 0 };
  int minor{ 0 };
  int build{ 0 };

  auto operator<=>(framework_version const &) const = default;
};

// Target framework parsed from a NuGet short folder name ("net472",
// "netstandard2.0", "netcoreapp2.1", "net5.0", "any", "p1", "uap10.0").
class framework {
 public:
  enum class family { net_framework, net_core_app, net_standard, any, generic, unsupported };

  framework() = default;
  framework(family fam, framework_version version, std::string identifier = {});

  // Never throws; unrecognised names produce an unsupported framework.
  static framework parse(std::string_view short_folder_name);
  static framework any_framework() { return framework{ family::any, {} }; }

  family get_family() const { return family_; }
  framework_version const &version() const { return version_; }

  // Lowercase moniker for generic frameworks ("p", "uap"); family name otherwise.
  std::string const &identifier() const { return identifier_; }

  bool is_unsupported() const { return family_ == family::unsupported; }

  // True when assets built for this framework can be consumed by `target`.
  bool is_compatible_with(framework const &target) const;

  std::string to_string() const;

  friend bool operator==(framework const &, framework const &) = default;

 private:
  family family_{ family::unsupported };
  framework_version version_;
  std::string identifier_;
};

// Index of the candidate nearest to `target`: same family with the highest
// version, then netstandard with the highest version, then any. Incompatible
// candidates are never chosen.
std::optional<std::size_t> framework_nearest(framework const &target,
                                             std::vector<framework> const &candidates);

}  // namespace refpack
