#pragma once

#include "util.h"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>

namespace refpack::platform {

// Exclusive advisory lock on a file, shared across threads and processes. The lock
// file itself is left in place when released so that concurrent waiters keep
// contending on the same inode.
class file_lock : uncopyable {
 public:
  // Blocks until acquired. Throws cancelled_error if `stop` is requested first and
  // std::system_error when the lock file cannot be opened or locked.
  // `on_contended` runs once, before waiting, if another holder has the lock.
  explicit file_lock(std::filesystem::path const &path,
                     std::stop_token stop = {},
                     std::function<void()> const &on_contended = {});
  ~file_lock();
  file_lock(file_lock &&) noexcept;
  file_lock &operator=(file_lock &&) = delete;

  explicit operator bool() const;

 private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);

// <temp>/test-packages, overridable through REFPACK_PACKAGES_ROOT.
std::filesystem::path get_default_packages_root();

// NUGET_PACKAGES, else $HOME/.nuget/packages.
std::optional<std::filesystem::path> get_default_global_packages_folder();

std::filesystem::path get_exe_path();

}  // namespace refpack::platform
