#include "package_contents.h"

#include "errors.h"
#include "extract.h"
#include "util.h"

#include <algorithm>
#include <iterator>
#include <system_error>
#include <utility>

namespace refpack {

package_contents::package_contents(std::vector<std::string> files,
                                   std::optional<nuspec> manifest)
    : files_{ std::move(files) }, manifest_{ std::move(manifest) } {
  std::ranges::sort(files_);
}

package_contents package_contents::from_folder(std::filesystem::path const &dir) {
  std::vector<std::string> files;
  std::optional<nuspec> manifest;

  std::error_code ec;
  std::filesystem::recursive_directory_iterator it{ dir, ec };
  if (ec) { throw io_error("Failed to list " + dir.string() + ": " + ec.message()); }

  for (std::filesystem::recursive_directory_iterator const end; it != end; it.increment(ec)) {
    if (ec) { throw io_error("Failed to list " + dir.string() + ": " + ec.message()); }
    if (!it->is_regular_file(ec)) { continue; }

    auto const rel{ it->path().lexically_relative(dir).generic_string() };
    if (!manifest && rel.find('/') == std::string::npos && util_iends_with(rel, ".nuspec")) {
      auto const bytes{ util_load_file(it->path()) };
      manifest = nuspec::parse(
          std::string_view{ reinterpret_cast<char const *>(bytes.data()), bytes.size() });
    }
    files.push_back(rel);
  }

  return package_contents{ std::move(files), std::move(manifest) };
}

package_contents package_contents::from_archive(std::filesystem::path const &nupkg) {
  return package_contents{ extract_list_entries(nupkg),
                           nuspec::parse(extract_read_nuspec(nupkg)) };
}

bool package_contents::has_compile_assets() const {
  return std::ranges::any_of(files_, [](std::string const &f) {
    return util_istarts_with(f, "lib/") || util_istarts_with(f, "ref/");
  });
}

std::vector<asset_group> package_contents::groups(std::string_view folder,
                                                  bool root_files_are_net) const {
  std::string const prefix{ std::string{ folder } + "/" };
  std::vector<asset_group> result;

  auto const group_for{ [&](framework const &f) -> asset_group & {
    for (auto &g : result) {
      if (g.target == f) { return g; }
    }
    result.push_back(asset_group{ f, {} });
    return result.back();
  } };

  for (auto const &file : files_) {
    if (!util_istarts_with(file, prefix)) { continue; }
    std::string_view const rest{ std::string_view{ file }.substr(prefix.size()) };

    auto const slash{ rest.find('/') };
    if (slash == std::string_view::npos) {
      if (root_files_are_net) {
        group_for(framework{ framework::family::net_framework, {} }).items.push_back(file);
      }
      continue;
    }

    auto const target{ framework::parse(rest.substr(0, slash)) };
    if (target.is_unsupported()) { continue; }
    group_for(target).items.push_back(file);
  }
  return result;
}

std::vector<asset_group> package_contents::lib_groups() const { return groups("lib", true); }

std::vector<asset_group> package_contents::ref_groups() const { return groups("ref", false); }

std::vector<asset_group> package_contents::framework_groups() const {
  std::vector<asset_group> result;
  if (!manifest_) { return result; }

  auto const add{ [&](framework const &f, std::string const &name) {
    auto it{ std::ranges::find_if(result, [&](asset_group const &g) { return g.target == f; }) };
    if (it == result.end()) {
      result.push_back(asset_group{ f, {} });
      it = std::prev(result.end());
    }
    it->items.push_back(name);
  } };

  for (auto const &fa : manifest_->framework_assemblies) {
    if (fa.target_frameworks.empty()) {
      add(framework::any_framework(), fa.assembly_name);
      continue;
    }
    for (auto const &f : fa.target_frameworks) {
      if (!f.is_unsupported()) { add(f, fa.assembly_name); }
    }
  }
  return result;
}

}  // namespace refpack
