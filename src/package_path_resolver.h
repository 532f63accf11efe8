#pragma once

#include "package_identity.h"

#include <filesystem>
#include <optional>
#include <string>

namespace refpack {

// Maps package identities to install directories under a packages root.
//   side_by_side:  <root>/<Id>.<Version>/          (the test-packages cache)
//   hierarchical:  <root>/<id>/<version>/          (the global packages folder)
// A directory counts as installed once its <id>.<version>.nupkg.sha512 marker exists.
class package_path_resolver {
 public:
  enum class layout { side_by_side, hierarchical };

  package_path_resolver(std::filesystem::path root, layout l);

  std::filesystem::path const &root() const { return root_; }
  layout get_layout() const { return layout_; }

  std::filesystem::path install_path(package_identity const &identity) const;

  static std::string nupkg_file_name(package_identity const &identity);
  static std::string marker_file_name(package_identity const &identity);

  // nullopt when not installed or when probing fails (overlong names included).
  std::optional<std::filesystem::path> installed_path(package_identity const &identity) const;

 private:
  std::filesystem::path root_;
  layout layout_;
};

}  // namespace refpack
