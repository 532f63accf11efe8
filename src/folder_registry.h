#pragma once

#include "package_registry.h"

#include <filesystem>
#include <string>

namespace refpack {

// Local feed: <root>/<Id>.<Version>.nupkg or <root>/<id>/<version>/<id>.<version>.nupkg.
class folder_registry : public package_registry {
 public:
  explicit folder_registry(std::filesystem::path root);

  std::string const &name() const override { return name_; }
  std::filesystem::path const &root() const { return root_; }

  std::optional<dependency_info> resolve_package(package_identity const &identity,
                                                 framework const &target,
                                                 source_cache_context &ctx,
                                                 std::stop_token const &stop) const override;

  std::filesystem::path download(package_identity const &identity,
                                 source_cache_context &ctx,
                                 std::stop_token const &stop) const override;

  std::optional<std::filesystem::path> find_nupkg(package_identity const &identity) const;

 private:
  std::filesystem::path root_;
  std::string name_;
};

}  // namespace refpack
