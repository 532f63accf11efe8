#pragma once

#include "package_identity.h"
#include "package_path_resolver.h"
#include "platform.h"
#include "util.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace refpack {

// Two-tier store of extracted packages: the writable local cache
// (<tmp>/test-packages) and an optional read-only global packages folder.
class package_cache : unmovable {
 public:
  using path = std::filesystem::path;

  // Cross-process lock over the local cache root, released on destruction.
  class scoped_lock : unmovable {
   public:
    scoped_lock(path lock_path, std::string owner, std::stop_token const &stop);
    ~scoped_lock();

    path const &lock_path() const { return lock_path_; }

   private:
    path lock_path_;
    std::string owner_;
    std::chrono::steady_clock::time_point wait_start_;
    platform::file_lock lock_;
    std::chrono::steady_clock::time_point acquired_at_;
  };

  package_cache(package_path_resolver local, std::optional<package_path_resolver> global);

  package_path_resolver const &local() const { return local_; }
  std::optional<package_path_resolver> const &global() const { return global_; }

  path lock_path() const { return local_.root() / ".lock"; }

  // Creates the local root if needed, then blocks until the lock is held.
  std::unique_ptr<scoped_lock> lock(std::string owner, std::stop_token const &stop) const;

  // Local tier first, then global.
  std::optional<path> installed_path(package_identity const &identity) const;

  // Extracts `nupkg` into the local tier and writes the completion marker last.
  // The caller must hold the lock.
  path install(package_identity const &identity,
               path const &nupkg,
               std::stop_token const &stop) const;

 private:
  package_path_resolver local_;
  std::optional<package_path_resolver> global_;
};

}  // namespace refpack
