#include "cmd_resolve.h"

#include "errors.h"
#include "framework.h"
#include "package_identity.h"
#include "presets.h"
#include "resolve_context.h"
#include "tui.h"

#include <utility>

namespace refpack {

cmd_resolve::cmd_resolve(cmd_resolve::cfg cfg, settings_overrides overrides)
    : cfg_{ std::move(cfg) }, overrides_{ std::move(overrides) } {}

descriptor cmd_resolve::make_descriptor(cfg const &cfg) {
  if (cfg.root_package.has_value() != cfg.root_path.has_value()) {
    throw parse_error("--root and --root-path must be given together");
  }

  std::vector<package_identity> packages;
  packages.reserve(cfg.packages.size());
  for (auto const &p : cfg.packages) { packages.push_back(package_identity::parse(p)); }

  descriptor const *preset{ cfg.target.empty() ? &presets::default_preset()
                                               : presets::find(cfg.target) };
  if (preset) {
    if (cfg.root_package) {
      throw parse_error("--root cannot be combined with preset '" +
                        preset->target_framework() + "'");
    }
    return preset->add_packages(packages).add_assemblies(cfg.assemblies);
  }

  if (framework::parse(cfg.target).is_unsupported()) {
    throw parse_error("Unsupported target framework '" + cfg.target + "'");
  }

  if (cfg.root_package) {
    return descriptor{ cfg.target, package_identity::parse(*cfg.root_package), *cfg.root_path }
        .add_packages(packages)
        .add_assemblies(cfg.assemblies);
  }
  return descriptor{ cfg.target }.add_packages(packages).add_assemblies(cfg.assemblies);
}

void cmd_resolve::execute(std::stop_token const &stop) {
  auto const d{ make_descriptor(cfg_) };
  resolve_context const ctx{ settings::load(overrides_) };

  tui::debug("resolve: %s (packages root %s)",
             d.target_framework().c_str(),
             ctx.config().packages_root.string().c_str());

  auto const result{ d.resolve(cfg_.language, ctx, stop) };
  for (auto const &path : *result) { tui::print_stdout("%s\n", path.string().c_str()); }
  tui::info("Resolved %zu reference assemblies", result->size());
}

}  // namespace refpack
