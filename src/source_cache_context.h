#pragma once

#include "package_identity.h"
#include "util.h"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace refpack {

// Scratch state shared by every registry call of one resolution: downloaded
// manifests and archives live in a private directory that is removed when the
// context goes away, so a package is fetched at most once per resolution.
class source_cache_context : unmovable {
 public:
  using path = std::filesystem::path;

  // Creates <scratch_root>/.scratch-<random>.
  explicit source_cache_context(path const &scratch_root);
  ~source_cache_context();

  path const &directory() const { return dir_; }

  // <directory>/<id>.<version>.<extension>, lowercase.
  path file_for(package_identity const &identity, char const *extension) const;

  std::optional<path> find_download(package_identity const &identity) const;
  void record_download(package_identity const &identity, path const &nupkg);
  std::size_t download_count() const;

 private:
  path dir_;
  mutable std::mutex mutex_;
  std::unordered_map<package_identity, path> downloads_;
};

}  // namespace refpack
