#pragma once

#include "package_registry.h"

#include <string>

namespace refpack {

// NuGet v3 flat-container feed:
//   {base}/{id}/{version}/{id}.nuspec
//   {base}/{id}/{version}/{id}.{version}.nupkg
// with lowercase id and normalized version.
class http_registry : public package_registry {
 public:
  explicit http_registry(std::string base_url);

  std::string const &name() const override { return base_url_; }

  std::optional<dependency_info> resolve_package(package_identity const &identity,
                                                 framework const &target,
                                                 source_cache_context &ctx,
                                                 std::stop_token const &stop) const override;

  std::filesystem::path download(package_identity const &identity,
                                 source_cache_context &ctx,
                                 std::stop_token const &stop) const override;

  std::string nuspec_url(package_identity const &identity) const;
  std::string nupkg_url(package_identity const &identity) const;

 private:
  std::string base_url_;
};

}  // namespace refpack
