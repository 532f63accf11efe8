#pragma once

#include "framework.h"
#include "nuspec.h"
#include "package_identity.h"
#include "util.h"

#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace refpack {

class package_registry;
class source_cache_context;

struct dependency_info {
  package_identity identity;
  std::vector<package_dependency> dependencies;
  package_registry const *source{ nullptr };  // authoritative registry for downloads
};

// A package source. Implementations are immutable after construction and safe
// to call from several threads at once.
class package_registry : unmovable {
 public:
  virtual ~package_registry() = default;

  virtual std::string const &name() const = 0;

  // Dependencies of `identity` applicable to `target`, or nullopt when this
  // registry does not have the package.
  virtual std::optional<dependency_info> resolve_package(package_identity const &identity,
                                                         framework const &target,
                                                         source_cache_context &ctx,
                                                         std::stop_token const &stop) const = 0;

  // Local path of the package archive. Throws package_not_found_error if the
  // registry does not have it, io_error on transfer failure.
  virtual std::filesystem::path download(package_identity const &identity,
                                         source_cache_context &ctx,
                                         std::stop_token const &stop) const = 0;
};

}  // namespace refpack
