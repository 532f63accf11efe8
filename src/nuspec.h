#pragma once

#include "framework.h"
#include "package_version.h"
#include "version_range.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace refpack {

struct package_dependency {
  std::string id;
  version_range range;
};

// Dependencies declared directly under <dependencies> have no target framework
// and apply to every target.
struct dependency_group {
  std::optional<framework> target_framework;
  std::vector<package_dependency> dependencies;
};

struct framework_assembly {
  std::string assembly_name;
  std::vector<framework> target_frameworks;  // empty: any
};

// The subset of a .nuspec manifest needed for resolution.
struct nuspec {
  std::string id;
  package_version version;
  std::vector<dependency_group> dependency_groups;
  std::vector<framework_assembly> framework_assemblies;

  // Throws parse_error on malformed XML or missing id/version.
  static nuspec parse(std::string_view xml);

  // Nearest framework-specific group plus every ungrouped dependency.
  std::vector<package_dependency> dependencies_for(framework const &target) const;
};

}  // namespace refpack
