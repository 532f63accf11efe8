#include "package_identity.h"

#include "errors.h"
#include "util.h"

#include <string>

namespace refpack {

package_identity package_identity::parse(std::string_view text) {
  std::string_view const trimmed{ util_trim(text) };
  auto sep{ trimmed.rfind('@') };
  if (sep == std::string_view::npos) { sep = trimmed.rfind('/'); }
  if (sep == std::string_view::npos || sep == 0 || sep + 1 == trimmed.size()) {
    throw parse_error("invalid package identity '" + std::string{ trimmed } +
                      "' (expected Id@Version)");
  }

  std::string_view const id{ util_trim(trimmed.substr(0, sep)) };
  if (id.empty()) { throw parse_error("empty package id in '" + std::string{ trimmed } + "'"); }

  return package_identity{ std::string{ id }, package_version::parse(trimmed.substr(sep + 1)) };
}

std::string package_identity::to_string() const { return id + "@" + version.to_string(); }

bool operator==(package_identity const &lhs, package_identity const &rhs) {
  return lhs.version == rhs.version && util_iequals(lhs.id, rhs.id);
}

bool operator<(package_identity const &lhs, package_identity const &rhs) {
  auto const l{ util_to_lower(lhs.id) };
  auto const r{ util_to_lower(rhs.id) };
  if (l != r) { return l < r; }
  return lhs.version < rhs.version;
}

}  // namespace refpack

std::size_t std::hash<refpack::package_identity>::operator()(
    refpack::package_identity const &p) const noexcept {
  std::size_t const h1{ std::hash<std::string>{}(refpack::util_to_lower(p.id)) };
  std::size_t const h2{ std::hash<refpack::package_version>{}(p.version) };
  return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
}
