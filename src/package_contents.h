#pragma once

#include "framework.h"
#include "nuspec.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace refpack {

// Items sharing one target framework: package-relative files (forward
// slashes) for lib/ and ref/, assembly names for <frameworkAssemblies>.
struct asset_group {
  framework target;
  std::vector<std::string> items;
};

// File listing and manifest of one package, from an extracted folder or an archive.
class package_contents {
 public:
  package_contents(std::vector<std::string> files, std::optional<nuspec> manifest);

  // Throws io_error when the folder cannot be listed.
  static package_contents from_folder(std::filesystem::path const &dir);
  static package_contents from_archive(std::filesystem::path const &nupkg);

  std::vector<std::string> const &files() const { return files_; }
  std::optional<nuspec> const &manifest() const { return manifest_; }

  // True when any file lives under lib/ or ref/.
  bool has_compile_assets() const;

  // Files directly under lib/ form a group targeting net 0.0.
  std::vector<asset_group> lib_groups() const;
  std::vector<asset_group> ref_groups() const;

  // <frameworkAssembly> names grouped by target framework. An entry listing
  // several frameworks joins each of their groups; untargeted entries form the
  // `any` group.
  std::vector<asset_group> framework_groups() const;

 private:
  std::vector<asset_group> groups(std::string_view folder, bool root_files_are_net) const;

  std::vector<std::string> files_;
  std::optional<nuspec> manifest_;
};

}  // namespace refpack
