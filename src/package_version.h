#pragma once

#include "semver.hpp"

#include <compare>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace refpack {

// NuGet-style semantic version. Accepts one to four numeric components, an
// optional -prerelease label and optional +metadata. The fourth (revision)
// component ranks after patch and before the prerelease label; otherwise
// ordering follows SemVer 2.0 precedence. Prerelease labels compare
// case-insensitively and metadata is ignored.
class package_version {
 public:
  package_version();
  package_version(int major, int minor, int patch, std::string prerelease = {});

  // Throws parse_error on malformed input.
  static package_version parse(std::string_view text);
  static std::optional<package_version> try_parse(std::string_view text);

  int major_version() const { return major_; }
  int minor_version() const { return minor_; }
  int patch_version() const { return patch_; }
  int revision() const { return revision_; }
  std::string const &prerelease() const { return prerelease_; }
  bool is_prerelease() const { return !prerelease_.empty(); }

  // M.m.p[.r][-prerelease], the revision only when non-zero
  std::string to_string() const;

  // Lowercase normalized form used for cache directories and feed URLs.
  std::string to_lower_string() const;

  friend bool operator==(package_version const &lhs, package_version const &rhs);
  friend std::strong_ordering operator<=>(package_version const &lhs,
                                          package_version const &rhs);

 private:
  int major_{ 0 };
  int minor_{ 0 };
  int patch_{ 0 };
  int revision_{ 0 };
  std::string prerelease_;
  semver::version<> precedence_;
};

}  // namespace refpack

template <>
struct std::hash<refpack::package_version> {
  std::size_t operator()(refpack::package_version const &v) const noexcept {
    return std::hash<std::string>{}(v.to_lower_string());
  }
};
