#include "asset_selector.h"

#include <utility>
#include <vector>

namespace refpack {

namespace {

std::optional<asset_group> nearest_group(std::vector<asset_group> const &groups,
                                         framework const &target) {
  std::vector<framework> candidates;
  candidates.reserve(groups.size());
  for (auto const &g : groups) { candidates.push_back(g.target); }

  if (auto const idx{ framework_nearest(target, candidates) }) { return groups[*idx]; }
  return std::nullopt;
}

}  // namespace

asset_selection select_assets(package_contents const &contents, framework const &target) {
  asset_selection result;
  if (auto group{ nearest_group(contents.framework_groups(), target) }) {
    result.framework_assemblies = std::move(group->items);
  }

  if (auto group{ nearest_group(contents.ref_groups(), target) }) {
    result.source = asset_source::ref;
    result.selected_framework = group->target;
    result.compile_items = std::move(group->items);
  } else if (auto lib{ nearest_group(contents.lib_groups(), target) }) {
    result.source = asset_source::lib;
    result.selected_framework = lib->target;
    result.compile_items = std::move(lib->items);
  }
  return result;
}

}  // namespace refpack
