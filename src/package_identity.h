#pragma once

#include "package_version.h"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace refpack {

// Package id plus exact version. Ids compare case-insensitively.
struct package_identity {
  std::string id;
  package_version version;

  // "Id@Version" or "Id/Version". Throws parse_error.
  static package_identity parse(std::string_view text);

  std::string to_string() const;  // Id@Version
};

bool operator==(package_identity const &lhs, package_identity const &rhs);

// Orders by lowercase id, then version.
bool operator<(package_identity const &lhs, package_identity const &rhs);

}  // namespace refpack

template <>
struct std::hash<refpack::package_identity> {
  std::size_t operator()(refpack::package_identity const &p) const noexcept;
};
