#pragma once

#include "framework.h"
#include "package_contents.h"

#include <optional>
#include <string>
#include <vector>

namespace refpack {

enum class asset_source { none, ref, lib };

struct asset_selection {
  asset_source source{ asset_source::none };
  std::optional<framework> selected_framework;
  std::vector<std::string> compile_items;          // package-relative paths
  std::vector<std::string> framework_assemblies;   // assembly names
};

// Nearest ref/ group when one is compatible, else nearest lib/ group.
// Framework assemblies come from their own nearest group, chosen
// independently of ref/ and lib/.
asset_selection select_assets(package_contents const &contents, framework const &target);

}  // namespace refpack
