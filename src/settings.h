#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace refpack {

struct settings_overrides {
  std::optional<std::filesystem::path> packages_root;
  std::optional<std::filesystem::path> global_packages;
  std::vector<std::string> sources;
};

// Effective configuration. Priority: overrides, then environment
// (REFPACK_PACKAGES_ROOT, NUGET_PACKAGES, REFPACK_SOURCES), then defaults.
struct settings {
  std::filesystem::path packages_root;
  std::optional<std::filesystem::path> global_packages;
  std::vector<std::string> sources;

  static settings load(settings_overrides const &overrides = {});
};

inline constexpr char kDefaultPackageSource[]{ "https://api.nuget.org/v3-flatcontainer/" };

}  // namespace refpack
