#include "package_path_resolver.h"

#include "util.h"

#include <system_error>
#include <utility>

namespace refpack {

package_path_resolver::package_path_resolver(std::filesystem::path root, layout l)
    : root_{ std::move(root) }, layout_{ l } {}

std::filesystem::path package_path_resolver::install_path(
    package_identity const &identity) const {
  switch (layout_) {
    case layout::side_by_side:
      return root_ / (identity.id + "." + identity.version.to_string());
    case layout::hierarchical:
      return root_ / util_to_lower(identity.id) / identity.version.to_lower_string();
  }
  return {};
}

std::string package_path_resolver::nupkg_file_name(package_identity const &identity) {
  return util_to_lower(identity.id) + "." + identity.version.to_lower_string() + ".nupkg";
}

std::string package_path_resolver::marker_file_name(package_identity const &identity) {
  return nupkg_file_name(identity) + ".sha512";
}

std::optional<std::filesystem::path> package_path_resolver::installed_path(
    package_identity const &identity) const {
  auto const dir{ install_path(identity) };
  std::error_code ec;
  if (!std::filesystem::is_regular_file(dir / marker_file_name(identity), ec) || ec) {
    return std::nullopt;
  }
  return dir;
}

}  // namespace refpack
