#pragma once

#include "package_cache.h"
#include "package_registry.h"
#include "settings.h"
#include "util.h"

#include <memory>
#include <vector>

namespace refpack {

// Everything a resolution needs from the outside world: configuration, the
// ordered package registries and the on-disk package cache.
class resolve_context : unmovable {
 public:
  // Registries are created from settings.sources (http(s) feeds and local folders).
  explicit resolve_context(settings cfg);
  resolve_context(settings cfg, std::vector<std::unique_ptr<package_registry>> registries);
  ~resolve_context();

  // Process-wide context built from settings::load() on first use.
  static resolve_context &shared();

  settings const &config() const { return settings_; }
  std::vector<package_registry const *> registries() const;
  package_cache const &cache() const { return cache_; }

 private:
  settings settings_;
  std::vector<std::unique_ptr<package_registry>> registries_;
  package_cache cache_;
};

// Throws parse_error for a source that is neither http(s) nor a local folder.
std::unique_ptr<package_registry> make_registry(std::string const &source);

}  // namespace refpack
