#include "resolve_context.h"

#include "errors.h"
#include "folder_registry.h"
#include "http_registry.h"
#include "uri.h"

#include <utility>

namespace refpack {

namespace {

std::vector<std::unique_ptr<package_registry>> make_registries(settings const &cfg) {
  std::vector<std::unique_ptr<package_registry>> result;
  for (auto const &source : cfg.sources) { result.push_back(make_registry(source)); }
  return result;
}

std::optional<package_path_resolver> make_global(settings const &cfg) {
  if (!cfg.global_packages) { return std::nullopt; }
  return package_path_resolver{ *cfg.global_packages,
                                package_path_resolver::layout::hierarchical };
}

}  // namespace

std::unique_ptr<package_registry> make_registry(std::string const &source) {
  auto const info{ uri_classify(source) };
  switch (info.scheme) {
    case uri_scheme::HTTP:
    case uri_scheme::HTTPS: return std::make_unique<http_registry>(info.canonical);
    case uri_scheme::LOCAL_FILE_ABSOLUTE:
    case uri_scheme::LOCAL_FILE_RELATIVE:
      return std::make_unique<folder_registry>(
          uri_resolve_local_file_relative(info.canonical, std::nullopt));
    case uri_scheme::UNKNOWN: break;
  }
  throw parse_error("Unsupported package source: '" + source + "'");
}

resolve_context::resolve_context(settings cfg)
    : resolve_context{ cfg, make_registries(cfg) } {}

resolve_context::resolve_context(settings cfg,
                                 std::vector<std::unique_ptr<package_registry>> registries)
    : settings_{ std::move(cfg) },
      registries_{ std::move(registries) },
      cache_{ package_path_resolver{ settings_.packages_root,
                                     package_path_resolver::layout::side_by_side },
              make_global(settings_) } {}

resolve_context::~resolve_context() = default;

resolve_context &resolve_context::shared() {
  static resolve_context ctx{ settings::load() };
  return ctx;
}

std::vector<package_registry const *> resolve_context::registries() const {
  std::vector<package_registry const *> result;
  result.reserve(registries_.size());
  for (auto const &r : registries_) { result.push_back(r.get()); }
  return result;
}

}  // namespace refpack
