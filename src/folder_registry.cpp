#include "folder_registry.h"

#include "errors.h"
#include "extract.h"
#include "source_cache_context.h"
#include "tui.h"

#include <system_error>
#include <utility>

namespace refpack {

folder_registry::folder_registry(std::filesystem::path root)
    : root_{ std::move(root) }, name_{ root_.string() } {}

std::optional<std::filesystem::path> folder_registry::find_nupkg(
    package_identity const &identity) const {
  std::string const lower_id{ util_to_lower(identity.id) };
  std::string const lower_version{ identity.version.to_lower_string() };
  std::string const file_name{ lower_id + "." + lower_version + ".nupkg" };

  std::error_code ec;
  auto const hierarchical{ root_ / lower_id / lower_version / file_name };
  if (std::filesystem::is_regular_file(hierarchical, ec)) { return hierarchical; }

  std::filesystem::directory_iterator it{ root_, ec };
  if (ec) { return std::nullopt; }
  for (std::filesystem::directory_iterator const end; it != end; it.increment(ec)) {
    if (ec) { return std::nullopt; }
    if (!it->is_regular_file(ec)) { continue; }
    if (util_iequals(it->path().filename().string(), file_name)) { return it->path(); }
  }
  return std::nullopt;
}

std::optional<dependency_info> folder_registry::resolve_package(
    package_identity const &identity,
    framework const &target,
    source_cache_context &,
    std::stop_token const &stop) const {
  throw_if_stopped(stop);

  auto const nupkg{ find_nupkg(identity) };
  if (!nupkg) { return std::nullopt; }

  auto const spec{ nuspec::parse(extract_read_nuspec(*nupkg)) };
  if (!util_iequals(spec.id, identity.id) || spec.version != identity.version) {
    tui::warn("%s: manifest declares %s@%s, expected %s",
              nupkg->string().c_str(),
              spec.id.c_str(),
              spec.version.to_string().c_str(),
              identity.to_string().c_str());
    return std::nullopt;
  }

  return dependency_info{ package_identity{ spec.id, spec.version },
                          spec.dependencies_for(target),
                          this };
}

std::filesystem::path folder_registry::download(package_identity const &identity,
                                                source_cache_context &ctx,
                                                std::stop_token const &stop) const {
  throw_if_stopped(stop);
  if (auto const cached{ ctx.find_download(identity) }) { return *cached; }

  auto const nupkg{ find_nupkg(identity) };
  if (!nupkg) {
    throw package_not_found_error(identity.to_string() + " not found in " + name_);
  }
  ctx.record_download(identity, *nupkg);
  return *nupkg;
}

}  // namespace refpack
