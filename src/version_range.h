#pragma once

#include "package_version.h"

#include <optional>
#include <string>
#include <string_view>

namespace refpack {

// NuGet version range. Plain "1.0" means ">= 1.0"; bracket notation gives
// inclusive ("[") or exclusive ("(") bounds, either of which may be open.
// "" and "*" accept every version.
class version_range {
 public:
  version_range() = default;

  // Throws parse_error on malformed input or when min > max.
  static version_range parse(std::string_view text);
  static version_range exact(package_version const &v);
  static version_range at_least(package_version const &v);

  std::optional<package_version> const &min_version() const { return min_; }
  std::optional<package_version> const &max_version() const { return max_; }
  bool is_min_inclusive() const { return min_inclusive_; }
  bool is_max_inclusive() const { return max_inclusive_; }

  bool satisfies(package_version const &v) const;

  // Normalized form: "1.0.0", "[1.0.0]", "[1.0.0, 2.0.0)", "(, 2.0.0]" or "*".
  std::string to_string() const;

  friend bool operator==(version_range const &, version_range const &) = default;

 private:
  std::optional<package_version> min_;
  std::optional<package_version> max_;
  bool min_inclusive_{ false };
  bool max_inclusive_{ false };
};

}  // namespace refpack
